#include "topology.h"
#include "log.h"
#include <algorithm>

namespace hive {

topology_builder::topology_builder(const std::string& agent_id, const topology_config& config)
    : agent_id_(agent_id), config_(config) {}

queue_options topology_builder::task_queue_options() const {
    queue_options opts;
    opts.durable = true;
    opts.message_ttl_ms = config_.task_ttl_ms;
    opts.max_length = config_.task_max_length;
    return opts;
}

queue_options topology_builder::results_queue_options() const {
    queue_options opts;
    opts.durable = true;
    return opts;
}

queue_options topology_builder::inbox_queue_options() const {
    queue_options opts;
    opts.exclusive = true;
    opts.auto_delete = true;
    return opts;
}

std::string topology_builder::brainstorm_queue() const {
    return config_.brainstorm_queue_prefix + agent_id_;
}

std::string topology_builder::status_queue() const {
    return config_.status_queue_prefix + agent_id_;
}

void topology_builder::declare_shared(broker_channel& ch) const {
    ch.declare_queue(config_.tasks_queue, task_queue_options());
    ch.declare_exchange(config_.brainstorm_exchange, EXCHANGE_KIND_FANOUT, true);
    ch.declare_queue(config_.results_queue, results_queue_options());
    ch.declare_exchange(config_.status_exchange, EXCHANGE_KIND_TOPIC, true);

    LOG_DBG("topology: declared %s, %s, %s, %s\n",
            config_.tasks_queue.c_str(), config_.brainstorm_exchange.c_str(),
            config_.results_queue.c_str(), config_.status_exchange.c_str());
}

std::string topology_builder::declare_brainstorm_inbox(broker_channel& ch) {
    const std::string queue = brainstorm_queue();
    ch.declare_queue(queue, inbox_queue_options());
    ch.bind_queue(queue, config_.brainstorm_exchange, "");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        has_inbox_ = true;
    }
    LOG_DBG("topology: inbox %s bound to %s\n", queue.c_str(), config_.brainstorm_exchange.c_str());
    return queue;
}

std::string topology_builder::declare_status_subscription(broker_channel& ch, const std::string& pattern) {
    const std::string queue = status_queue();
    ch.declare_queue(queue, inbox_queue_options());
    ch.bind_queue(queue, config_.status_exchange, pattern);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::find(status_patterns_.begin(), status_patterns_.end(), pattern) == status_patterns_.end()) {
            status_patterns_.push_back(pattern);
        }
    }
    LOG_DBG("topology: %s bound to %s with '%s'\n", queue.c_str(), config_.status_exchange.c_str(), pattern.c_str());
    return queue;
}

void topology_builder::declare_all(broker_channel& ch) {
    declare_shared(ch);

    bool inbox;
    std::vector<std::string> patterns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inbox = has_inbox_;
        patterns = status_patterns_;
    }

    if (inbox) {
        declare_brainstorm_inbox(ch);
    }
    for (const auto& pattern : patterns) {
        declare_status_subscription(ch, pattern);
    }
    LOG_INF("topology: declared for agent %s\n", agent_id_.c_str());
}

} // namespace hive
