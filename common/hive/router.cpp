#include "router.h"
#include "failure.h"

namespace hive {

template<typename Payload>
void message_router::on_typed(envelope_type type, typed_handler<Payload> h) {
    on(type, [h = std::move(h)](const envelope& env, delivery_controls& controls) {
        h(env, std::get<Payload>(env.payload), controls);
    });
}

void message_router::on(envelope_type type, handler h) {
    std::lock_guard<std::mutex> lock(mutex);
    handlers[type] = std::move(h);
}

void message_router::on_task(typed_handler<task_payload> h) {
    on_typed<task_payload>(ENVELOPE_TYPE_TASK, std::move(h));
}

void message_router::on_brainstorm(typed_handler<brainstorm_payload> h) {
    on_typed<brainstorm_payload>(ENVELOPE_TYPE_BRAINSTORM, std::move(h));
}

void message_router::on_result(typed_handler<result_payload> h) {
    on_typed<result_payload>(ENVELOPE_TYPE_RESULT, std::move(h));
}

void message_router::on_status(typed_handler<status_payload> h) {
    on_typed<status_payload>(ENVELOPE_TYPE_STATUS, std::move(h));
}

void message_router::on_vote(typed_handler<vote_payload> h) {
    on_typed<vote_payload>(ENVELOPE_TYPE_VOTE, std::move(h));
}

bool message_router::has_handler(envelope_type type) const {
    std::lock_guard<std::mutex> lock(mutex);
    return handlers.find(type) != handlers.end();
}

void message_router::remove(envelope_type type) {
    std::lock_guard<std::mutex> lock(mutex);
    handlers.erase(type);
}

void message_router::route(const envelope& env, delivery_controls& controls) const {
    env.validate();

    handler h;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = handlers.find(env.type());
        if (it == handlers.end()) {
            throw validation_error(std::string("no handler registered for envelope type '") +
                                   envelope_type_to_string(env.type()) + "'");
        }
        h = it->second;
    }

    h(env, controls);
}

} // namespace hive
