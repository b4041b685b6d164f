#pragma once

#include "message.h"
#include "failure.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <optional>

namespace hive {

// Broker header carrying the redelivery record of a requeued message
extern const char* const REDELIVERY_HEADER;

// Per-message redelivery bookkeeping, kept apart from the immutable envelope.
// Travels with the message so every competing consumer sees the same count.
struct redelivery_info {
    std::string message_id;
    int failures = 0;                      // Failed attempts so far
    int64_t first_failure_at = 0;
    std::vector<failure_record> history;   // Oldest first

    std::string to_header() const;

    // Throws validation_error on a malformed header
    static redelivery_info from_header(const std::string& value);
};

// Settlement actions for one consumed message
class delivery_controls {
public:
    virtual ~delivery_controls() = default;

    // Remove the message after success
    virtual void ack() = 0;

    // Return the message to its queue (requeue) or drop it
    virtual void nack(bool requeue) = 0;

    // Send the message straight to dead-letter, no retry
    virtual void reject() = 0;

    // Return the message to its queue with its redelivery record attached
    virtual void requeue(const redelivery_info&) { nack(true); }
};

enum delivery_outcome {
    DELIVERY_ACKED,
    DELIVERY_REQUEUED,
    DELIVERY_REJECTED
};

const char* delivery_outcome_to_string(delivery_outcome outcome);

// Applies the bounded-retry policy around a message handler:
// handler failure -> requeue while failures < max_retries, then reject to
// dead-letter. Malformed input is rejected on first sight. The controller keeps
// no per-message state; the caller threads the redelivery record through.
class delivery_controller {
public:
    using handler = std::function<void(const envelope&, delivery_controls&)>;

    delivery_controller(const std::string& agent_id,
                        const failure_policy& policy = failure_policy::default_policy());
    ~delivery_controller();

    // Parse `body`, run `h` and settle the delivery through `controls`.
    // `message_id` is the broker-level id, used when the body cannot be parsed.
    // `prior` is the record the message arrived with, empty on first delivery.
    delivery_outcome process(const std::string& message_id,
                             const std::string& body,
                             const redelivery_info& prior,
                             delivery_controls& controls,
                             const handler& h);

    // First delivery
    delivery_outcome process(const std::string& message_id,
                             const std::string& body,
                             delivery_controls& controls,
                             const handler& h);

    dead_letter_queue& dead_letters();
    const dead_letter_queue& dead_letters() const;

    const failure_policy& policy() const;

    struct stats {
        int64_t acked;
        int64_t requeued;
        int64_t rejected;
        int64_t malformed;
    };
    stats get_stats() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace hive
