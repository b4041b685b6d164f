#pragma once

#include "transport.h"
#include <string>
#include <vector>
#include <mutex>

namespace hive {

// Resource names and limits
struct topology_config {
    std::string tasks_queue = "agent.tasks";
    int64_t task_ttl_ms = 3600000;
    int64_t task_max_length = 10000;

    std::string brainstorm_exchange = "agent.brainstorm";
    std::string brainstorm_queue_prefix = "brainstorm.";

    std::string results_queue = "agent.results";

    std::string status_exchange = "agent.status";
    std::string status_queue_prefix = "status.";
};

// Declares the broker topology for one agent. Every declaration is
// idempotent so the whole set can be replayed after a reconnect.
class topology_builder {
public:
    explicit topology_builder(const std::string& agent_id,
                              const topology_config& config = topology_config());

    // agent.tasks, agent.brainstorm, agent.results, agent.status
    void declare_shared(broker_channel& ch) const;

    // brainstorm.<agentId> bound to the fanout exchange
    std::string declare_brainstorm_inbox(broker_channel& ch);

    // status.<agentId> bound to agent.status with `pattern`; the pattern is
    // remembered and rebound by declare_all
    std::string declare_status_subscription(broker_channel& ch, const std::string& pattern);

    // Everything above, including inboxes and bindings declared so far
    void declare_all(broker_channel& ch);

    std::string brainstorm_queue() const;
    std::string status_queue() const;

    queue_options task_queue_options() const;
    queue_options results_queue_options() const;
    queue_options inbox_queue_options() const;

    const topology_config& config() const { return config_; }
    const std::string& agent_id() const { return agent_id_; }

private:
    std::string agent_id_;
    topology_config config_;

    mutable std::mutex mutex_;
    bool has_inbox_ = false;
    std::vector<std::string> status_patterns_;
};

} // namespace hive
