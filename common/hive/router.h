#pragma once

#include "message.h"
#include "delivery.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace hive {

// Maps envelope type -> handler. Dispatching an envelope whose type has no
// handler throws validation_error (terminal, never retried).
class message_router {
public:
    using handler = std::function<void(const envelope&, delivery_controls&)>;

    template<typename Payload>
    using typed_handler = std::function<void(const envelope&, const Payload&, delivery_controls&)>;

    message_router() = default;

    // Register (or replace) the handler for a type
    void on(envelope_type type, handler h);

    void on_task(typed_handler<task_payload> h);
    void on_brainstorm(typed_handler<brainstorm_payload> h);
    void on_result(typed_handler<result_payload> h);
    void on_status(typed_handler<status_payload> h);
    void on_vote(typed_handler<vote_payload> h);

    bool has_handler(envelope_type type) const;
    void remove(envelope_type type);

    // Validate and dispatch
    void route(const envelope& env, delivery_controls& controls) const;

private:
    template<typename Payload>
    void on_typed(envelope_type type, typed_handler<Payload> h);

    std::map<envelope_type, handler> handlers;
    mutable std::mutex mutex;
};

} // namespace hive
