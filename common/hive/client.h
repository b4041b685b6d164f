#pragma once

#include "connection.h"
#include "topology.h"
#include "delivery.h"
#include "message.h"
#include <string>
#include <memory>
#include <functional>

namespace hive {

// Publish/consume surface of one agent. Task deliveries run through the
// delivery_controller retry policy; brainstorm, result and status deliveries
// are informational and always acked once the handler returns or throws.
class hive_client {
public:
    using handler = std::function<void(const envelope&, delivery_controls&)>;
    using outcome_listener = std::function<void(const std::string& message_id, delivery_outcome outcome)>;

    hive_client(connection_manager& conn,
                const std::string& agent_id,
                const topology_config& topology = topology_config());
    ~hive_client();

    hive_client(const hive_client&) = delete;
    hive_client& operator=(const hive_client&) = delete;

    // Declare the shared topology on the current channel
    void setup();

    // Publishers, each returns the envelope id
    std::string publish_task(const task_payload& task);
    std::string broadcast_brainstorm(const brainstorm_payload& message);
    std::string publish_result(const result_payload& result);
    std::string publish_vote(const vote_payload& vote);

    // Returns an empty id when disconnected (skipped with a warning)
    std::string publish_status(const status_payload& status,
                               const std::string& routing_key = "agent.status.info");

    // Consumers
    void consume_tasks(handler h);
    void listen_brainstorm(handler h);     // own broadcasts are acked and ignored
    void consume_results(handler h);
    void subscribe_status(handler h, const std::string& pattern = "agent.status.#");

    // Called after every task delivery is settled
    void set_outcome_listener(outcome_listener listener);

    // Wait up to timeout_ms and dispatch at most one delivery
    bool poll(int timeout_ms);

    // Consume loop on a worker thread
    void start(int poll_interval_ms = 1000);
    void stop();
    bool is_running() const;

    bool is_connected() const;

    const std::string& agent_id() const;
    topology_builder& topology();
    delivery_controller& controller();
    connection_manager& connection();

    struct stats {
        int64_t published;
        int64_t delivered;
        int64_t malformed;
        int64_t own_ignored;
        int64_t handler_errors;
    };
    stats get_stats() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace hive
