#include "client.h"
#include "log.h"
#include <atomic>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace hive {

namespace {

enum subscription_kind {
    SUBSCRIPTION_TASKS,
    SUBSCRIPTION_BRAINSTORM,
    SUBSCRIPTION_RESULTS,
    SUBSCRIPTION_STATUS
};

const char* subscription_kind_to_string(subscription_kind kind) {
    switch (kind) {
        case SUBSCRIPTION_TASKS: return "tasks";
        case SUBSCRIPTION_BRAINSTORM: return "brainstorm";
        case SUBSCRIPTION_RESULTS: return "results";
        case SUBSCRIPTION_STATUS: return "status";
        default: return "unknown";
    }
}

struct subscription {
    subscription_kind kind;
    std::string queue;
    bool exclusive;
    hive_client::handler h;
    std::string consumer_tag;
};

// Settles a broker delivery once
class channel_controls : public delivery_controls {
public:
    channel_controls(broker_channel& ch, const delivery& d, const std::string& queue)
        : ch_(ch), d_(d), queue_(queue) {}

    void ack() override {
        if (settled_) return;
        ch_.ack(d_);
        settled_ = true;
    }

    void nack(bool requeue) override {
        if (settled_) return;
        ch_.nack(d_, requeue);
        settled_ = true;
    }

    void reject() override {
        if (settled_) return;
        ch_.reject(d_);
        settled_ = true;
    }

    // A plain nack cannot change headers: publish the copy first, then ack.
    // A failed publish leaves the original unacked for the broker to redeliver.
    void requeue(const redelivery_info& info) override {
        if (settled_) return;
        if (queue_.empty()) {
            nack(true);
            return;
        }
        outbound_message copy;
        copy.body = d_.body;
        copy.content_type = d_.content_type;
        copy.message_id = d_.message_id;
        copy.persistent = true;
        copy.headers = d_.headers;
        copy.headers[REDELIVERY_HEADER] = info.to_header();
        ch_.publish("", queue_, copy);
        ch_.ack(d_);
        settled_ = true;
    }

    bool settled() const { return settled_; }

private:
    broker_channel& ch_;
    const delivery& d_;
    std::string queue_;
    bool settled_ = false;
};

} // namespace

struct hive_client::impl : public connection_listener {
    connection_manager& conn;
    std::string agent_id;
    topology_builder topology;
    delivery_controller controller;

    std::vector<subscription> subscriptions;
    mutable std::mutex mutex;

    outcome_listener on_outcome;

    std::atomic<bool> running{false};
    std::thread worker;

    std::atomic<int64_t> published{0};
    std::atomic<int64_t> delivered{0};
    std::atomic<int64_t> malformed{0};
    std::atomic<int64_t> own_ignored{0};
    std::atomic<int64_t> handler_errors{0};

    impl(connection_manager& c, const std::string& id, const topology_config& cfg)
        : conn(c), agent_id(id), topology(id, cfg),
          controller(id, c.policy()) {}

    // Replays topology and consumers on a fresh channel
    void on_connected() override {
        std::shared_ptr<broker_channel> ch;
        try {
            ch = conn.channel();
            topology.declare_all(*ch);

            std::lock_guard<std::mutex> lock(mutex);
            for (auto& sub : subscriptions) {
                sub.consumer_tag = ch->consume(sub.queue, sub.exclusive);
                LOG_DBG("client: resumed %s consumer on %s\n",
                        subscription_kind_to_string(sub.kind), sub.queue.c_str());
            }
        } catch (const error & e) {
            LOG_ERR("client: failed to restore topology: %s\n", e.what());
        }
    }

    std::string publish(const std::string& exchange, const std::string& routing_key,
                        const envelope& env, bool persistent) {
        outbound_message msg;
        msg.body = env.serialize();
        msg.message_id = env.id;
        msg.persistent = persistent;

        conn.with_channel([&](broker_channel& ch) {
            ch.publish(exchange, routing_key, msg);
        });
        published++;
        LOG_DBG("client: published %s %s to '%s' key '%s'\n",
                envelope_type_to_string(env.type()), env.id.c_str(),
                exchange.c_str(), routing_key.c_str());
        return env.id;
    }

    void subscribe(subscription_kind kind, const std::string& queue, bool exclusive, handler h) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto& sub : subscriptions) {
                if (sub.queue == queue) {
                    sub.h = std::move(h);
                    return;
                }
            }
        }

        std::string tag;
        conn.with_channel([&](broker_channel& ch) {
            tag = ch.consume(queue, exclusive);
        });

        std::lock_guard<std::mutex> lock(mutex);
        subscriptions.push_back({kind, queue, exclusive, std::move(h), tag});
        LOG_INF("client: consuming %s from %s\n", subscription_kind_to_string(kind), queue.c_str());
    }

    bool find(const std::string& consumer_tag, subscription& out) const {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& sub : subscriptions) {
            if (sub.consumer_tag == consumer_tag) {
                out = sub;
                return true;
            }
        }
        return false;
    }

    void dispatch(broker_channel& ch, const delivery& d) {
        subscription sub;
        if (!find(d.consumer_tag, sub)) {
            LOG_WRN("client: delivery for unknown consumer %s, requeueing\n", d.consumer_tag.c_str());
            ch.nack(d, true);
            return;
        }

        channel_controls controls(ch, d, sub.queue);
        delivered++;

        if (sub.kind == SUBSCRIPTION_TASKS) {
            redelivery_info prior;
            auto header = d.headers.find(REDELIVERY_HEADER);
            if (header != d.headers.end()) {
                try {
                    prior = redelivery_info::from_header(header->second);
                } catch (const validation_error & e) {
                    LOG_WRN("client: ignoring redelivery record of %s: %s\n", d.message_id.c_str(), e.what());
                }
            }
            const delivery_outcome outcome = controller.process(d.message_id, d.body, prior, controls, sub.h);
            LOG_DBG("client: task %s %s\n", d.message_id.c_str(), delivery_outcome_to_string(outcome));
            outcome_listener listener;
            {
                std::lock_guard<std::mutex> lock(mutex);
                listener = on_outcome;
            }
            if (listener) {
                listener(d.message_id, outcome);
            }
            return;
        }

        envelope env;
        try {
            env = envelope::parse(d.body);
        } catch (const validation_error & e) {
            malformed++;
            LOG_WRN("client: rejecting malformed %s message: %s\n",
                    subscription_kind_to_string(sub.kind), e.what());
            controls.reject();
            return;
        }

        if (sub.kind == SUBSCRIPTION_BRAINSTORM && env.from == agent_id) {
            own_ignored++;
            controls.ack();
            return;
        }

        try {
            sub.h(env, controls);
        } catch (const std::exception & e) {
            handler_errors++;
            LOG_WRN("client: %s handler failed for %s: %s\n",
                    subscription_kind_to_string(sub.kind), env.id.c_str(), e.what());
        }
        controls.ack();
    }
};

hive_client::hive_client(connection_manager& conn, const std::string& agent_id, const topology_config& topology)
    : pimpl(std::make_unique<impl>(conn, agent_id, topology)) {
    conn.add_listener(pimpl.get());
}

hive_client::~hive_client() {
    stop();
    pimpl->conn.remove_listener(pimpl.get());
}

void hive_client::setup() {
    pimpl->conn.with_channel([this](broker_channel& ch) {
        pimpl->topology.declare_shared(ch);
    });
}

std::string hive_client::publish_task(const task_payload& task) {
    auto env = envelope::make(pimpl->agent_id, task);
    env.validate();
    return pimpl->publish("", pimpl->topology.config().tasks_queue, env, true);
}

std::string hive_client::broadcast_brainstorm(const brainstorm_payload& message) {
    auto env = envelope::make(pimpl->agent_id, message);
    env.validate();
    return pimpl->publish(pimpl->topology.config().brainstorm_exchange, "", env, false);
}

std::string hive_client::publish_result(const result_payload& result) {
    auto env = envelope::make(pimpl->agent_id, result);
    env.validate();
    return pimpl->publish("", pimpl->topology.config().results_queue, env, true);
}

std::string hive_client::publish_vote(const vote_payload& vote) {
    auto env = envelope::make(pimpl->agent_id, vote);
    env.validate();
    return pimpl->publish("", pimpl->topology.config().results_queue, env, true);
}

std::string hive_client::publish_status(const status_payload& status, const std::string& routing_key) {
    if (!pimpl->conn.is_healthy()) {
        LOG_WRN("client: not connected, skipping status '%s'\n", routing_key.c_str());
        return "";
    }
    auto env = envelope::make(pimpl->agent_id, status);
    env.validate();
    return pimpl->publish(pimpl->topology.config().status_exchange, routing_key, env, false);
}

void hive_client::consume_tasks(handler h) {
    setup();
    pimpl->subscribe(SUBSCRIPTION_TASKS, pimpl->topology.config().tasks_queue, false, std::move(h));
}

void hive_client::listen_brainstorm(handler h) {
    std::string queue;
    pimpl->conn.with_channel([&](broker_channel& ch) {
        pimpl->topology.declare_shared(ch);
        queue = pimpl->topology.declare_brainstorm_inbox(ch);
    });
    pimpl->subscribe(SUBSCRIPTION_BRAINSTORM, queue, true, std::move(h));
}

void hive_client::consume_results(handler h) {
    setup();
    pimpl->subscribe(SUBSCRIPTION_RESULTS, pimpl->topology.config().results_queue, false, std::move(h));
}

void hive_client::subscribe_status(handler h, const std::string& pattern) {
    std::string queue;
    pimpl->conn.with_channel([&](broker_channel& ch) {
        pimpl->topology.declare_shared(ch);
        queue = pimpl->topology.declare_status_subscription(ch, pattern);
    });
    pimpl->subscribe(SUBSCRIPTION_STATUS, queue, true, std::move(h));
}

void hive_client::set_outcome_listener(outcome_listener listener) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->on_outcome = std::move(listener);
}

bool hive_client::poll(int timeout_ms) {
    std::shared_ptr<broker_channel> ch;
    try {
        ch = pimpl->conn.channel();
    } catch (const channel_error & e) {
        if (!pimpl->conn.on_channel_lost(e.what()) && pimpl->conn.reconnect_exhausted()) {
            throw max_reconnect_error("broker unavailable, reconnect budget exhausted");
        }
        return false;
    }

    delivery d;
    try {
        if (!ch->next_delivery(d, timeout_ms)) {
            return false;
        }
        pimpl->dispatch(*ch, d);
    } catch (const channel_error & e) {
        // unsettled deliveries go back to the queue with the channel
        if (!pimpl->conn.on_channel_lost(e.what()) && pimpl->conn.reconnect_exhausted()) {
            throw max_reconnect_error("broker unavailable, reconnect budget exhausted");
        }
        return false;
    }
    return true;
}

void hive_client::start(int poll_interval_ms) {
    if (pimpl->running.exchange(true)) {
        return;
    }
    pimpl->worker = std::thread([this, poll_interval_ms]() {
        LOG_INF("client: consume loop started for %s\n", pimpl->agent_id.c_str());
        while (pimpl->running) {
            try {
                if (!poll(poll_interval_ms) && !pimpl->conn.is_healthy() && !pimpl->conn.auto_reconnect()) {
                    LOG_WRN("client: connection lost and auto-reconnect disabled, stopping\n");
                    pimpl->running = false;
                }
            } catch (const max_reconnect_error & e) {
                LOG_ERR("client: %s\n", e.what());
                pimpl->running = false;
            }
        }
        LOG_INF("client: consume loop stopped\n");
    });
}

void hive_client::stop() {
    pimpl->running = false;
    if (pimpl->worker.joinable()) {
        pimpl->worker.join();
    }
}

bool hive_client::is_running() const {
    return pimpl->running;
}

bool hive_client::is_connected() const {
    return pimpl->conn.is_healthy();
}

const std::string& hive_client::agent_id() const {
    return pimpl->agent_id;
}

topology_builder& hive_client::topology() {
    return pimpl->topology;
}

delivery_controller& hive_client::controller() {
    return pimpl->controller;
}

connection_manager& hive_client::connection() {
    return pimpl->conn;
}

hive_client::stats hive_client::get_stats() const {
    stats s;
    s.published = pimpl->published;
    s.delivered = pimpl->delivered;
    s.malformed = pimpl->malformed;
    s.own_ignored = pimpl->own_ignored;
    s.handler_errors = pimpl->handler_errors;
    return s;
}

} // namespace hive
