#include "delivery.h"
#include "log.h"
#include <atomic>

namespace hive {

const char* const REDELIVERY_HEADER = "x-hive-redelivery";

std::string redelivery_info::to_header() const {
    json j;
    j["message_id"] = message_id;
    j["failures"] = failures;
    j["first_failure_at"] = first_failure_at;
    j["history"] = json::array();
    for (const auto& record : history) {
        j["history"].push_back(json::parse(record.to_json()));
    }
    return j.dump();
}

redelivery_info redelivery_info::from_header(const std::string& value) {
    redelivery_info info;
    try {
        json j = json::parse(value);
        info.message_id = j.value("message_id", "");
        info.failures = j.value("failures", 0);
        info.first_failure_at = j.value("first_failure_at", (int64_t) 0);
        for (const auto& record : j.value("history", json::array())) {
            info.history.push_back(failure_record::from_json(record.dump()));
        }
    } catch (const json::exception & e) {
        throw validation_error(std::string("malformed redelivery header: ") + e.what());
    }
    if (info.failures < 0) {
        throw validation_error("malformed redelivery header: negative failure count");
    }
    return info;
}

const char* delivery_outcome_to_string(delivery_outcome outcome) {
    switch (outcome) {
        case DELIVERY_ACKED: return "acked";
        case DELIVERY_REQUEUED: return "requeued";
        case DELIVERY_REJECTED: return "rejected";
        default: return "unknown";
    }
}

// Forwards to the real controls and remembers how the message was settled
class tracked_controls : public delivery_controls {
public:
    explicit tracked_controls(delivery_controls& inner) : inner_(inner) {}

    void ack() override {
        if (settled_) return;
        inner_.ack();
        settle(DELIVERY_ACKED);
    }

    void nack(bool requeue) override {
        if (settled_) return;
        inner_.nack(requeue);
        settle(requeue ? DELIVERY_REQUEUED : DELIVERY_REJECTED);
    }

    void reject() override {
        if (settled_) return;
        inner_.reject();
        settle(DELIVERY_REJECTED);
    }

    void requeue(const redelivery_info& info) override {
        if (settled_) return;
        inner_.requeue(info);
        settle(DELIVERY_REQUEUED);
    }

    bool settled() const { return settled_; }
    delivery_outcome outcome() const { return outcome_; }

private:
    void settle(delivery_outcome outcome) {
        settled_ = true;
        outcome_ = outcome;
    }

    delivery_controls& inner_;
    bool settled_ = false;
    delivery_outcome outcome_ = DELIVERY_ACKED;
};

struct delivery_controller::impl {
    std::string agent_id;
    failure_policy policy;
    dead_letter_queue dlq;

    std::atomic<int64_t> acked{0};
    std::atomic<int64_t> requeued{0};
    std::atomic<int64_t> rejected{0};
    std::atomic<int64_t> malformed{0};

    impl(const std::string& id, const failure_policy& p) : agent_id(id), policy(p), dlq(1000) {}

    failure_record make_record(const std::string& message_id, error_type type,
                               const std::string& message, int attempt) const {
        failure_record record;
        record.message_id = message_id;
        record.agent_id = agent_id;
        record.error = type;
        record.error_message = message;
        record.timestamp = get_timestamp_ms();
        record.attempt = attempt;
        return record;
    }

    delivery_outcome count(delivery_outcome outcome) {
        switch (outcome) {
            case DELIVERY_ACKED: acked++; break;
            case DELIVERY_REQUEUED: requeued++; break;
            case DELIVERY_REJECTED: rejected++; break;
        }
        return outcome;
    }

    // Terminal failure: never retried
    delivery_outcome reject_invalid(const std::string& message_id, const std::string& body,
                                    const std::string& reason, delivery_controls& controls) {
        malformed++;
        auto record = make_record(message_id, ERROR_TYPE_VALIDATION, reason, 1);
        dlq.add_message(message_id, body, record, {record});
        controls.reject();
        LOG_WRN("delivery %s rejected as invalid: %s\n", message_id.c_str(), reason.c_str());
        return count(DELIVERY_REJECTED);
    }
};

delivery_controller::delivery_controller(const std::string& agent_id, const failure_policy& policy)
    : pimpl(std::make_unique<impl>(agent_id, policy)) {}

delivery_controller::~delivery_controller() = default;

delivery_outcome delivery_controller::process(const std::string& message_id,
                                              const std::string& body,
                                              delivery_controls& controls,
                                              const handler& h) {
    return process(message_id, body, redelivery_info(), controls, h);
}

delivery_outcome delivery_controller::process(const std::string& message_id,
                                              const std::string& body,
                                              const redelivery_info& prior,
                                              delivery_controls& controls,
                                              const handler& h) {
    envelope env;
    try {
        env = envelope::parse(body);
    } catch (const validation_error& e) {
        return pimpl->reject_invalid(message_id, body, e.what(), controls);
    }

    const std::string& id = env.id;
    tracked_controls tracked(controls);

    try {
        h(env, tracked);
        if (!tracked.settled()) {
            tracked.ack();
        }
        return pimpl->count(tracked.outcome());
    } catch (const validation_error& e) {
        if (tracked.settled()) {
            LOG_ERR("delivery %s failed after settlement: %s\n", id.c_str(), e.what());
            return pimpl->count(tracked.outcome());
        }
        return pimpl->reject_invalid(id, body, e.what(), tracked);
    } catch (const std::exception& e) {
        if (tracked.settled()) {
            LOG_ERR("delivery %s failed after settlement: %s\n", id.c_str(), e.what());
            return pimpl->count(tracked.outcome());
        }

        redelivery_info info = prior;
        info.message_id = id;
        if (info.first_failure_at == 0) {
            info.first_failure_at = get_timestamp_ms();
        }
        auto record = pimpl->make_record(id, ERROR_TYPE_HANDLER, e.what(), info.failures + 1);
        info.history.push_back(record);

        if (info.failures < pimpl->policy.max_retries) {
            info.failures++;
            LOG_WRN("delivery %s failed (attempt %d/%d), requeueing: %s\n",
                    id.c_str(), info.failures, pimpl->policy.max_retries + 1, e.what());
            tracked.requeue(info);
            return pimpl->count(DELIVERY_REQUEUED);
        }

        record.error = ERROR_TYPE_RETRY_EXHAUSTED;
        pimpl->dlq.add_message(id, body, record, info.history);

        LOG_ERR("delivery %s dead-lettered after %zu attempts: %s\n",
                id.c_str(), info.history.size(), e.what());
        tracked.reject();
        return pimpl->count(DELIVERY_REJECTED);
    }
}

dead_letter_queue& delivery_controller::dead_letters() {
    return pimpl->dlq;
}

const dead_letter_queue& delivery_controller::dead_letters() const {
    return pimpl->dlq;
}

const failure_policy& delivery_controller::policy() const {
    return pimpl->policy;
}

delivery_controller::stats delivery_controller::get_stats() const {
    stats s;
    s.acked = pimpl->acked;
    s.requeued = pimpl->requeued;
    s.rejected = pimpl->rejected;
    s.malformed = pimpl->malformed;
    return s;
}

} // namespace hive
