// params.h
#pragma once

#include "transport.h"
#include "failure.h"
#include <string>
#include <cstdint>

namespace hive {

struct hive_params {
    // Broker
    std::string url;
    int32_t heartbeat_s;
    int32_t prefetch_count;
    bool auto_reconnect;

    // Identity
    std::string agent_id;
    std::string agent_name;
    std::string role;            // worker, team-leader, collaborator, coordinator, monitor

    // Delivery
    int32_t max_retries;

    // Orchestration
    int32_t poll_interval_ms;
    int64_t collaboration_timeout_ms;
    int32_t required_responses;

    // Logging
    int32_t verbosity;
    std::string log_file;
};

// Default parameters
inline hive_params hive_default_params() {
    hive_params params;

    params.url = "amqp://localhost:5672";
    params.heartbeat_s = 30;
    params.prefetch_count = 1;
    params.auto_reconnect = true;

    params.agent_id = "";
    params.agent_name = "";
    params.role = "worker";

    params.max_retries = 3;

    params.poll_interval_ms = 1000;
    params.collaboration_timeout_ms = 30000;
    params.required_responses = 1;

    params.verbosity = 0;
    params.log_file = "";

    return params;
}

// Apply RABBITMQ_URL, HEARTBEAT_INTERVAL, AUTO_RECONNECT, PREFETCH_COUNT,
// AGENT_ID, AGENT_NAME, AGENT_TYPE, MAX_RETRIES, LOG_VERBOSITY
void hive_params_from_env(hive_params& params);

// Parse command line flags over `params`. Returns false when the program
// should exit (help requested or bad arguments).
bool hive_params_parse(int argc, char** argv, hive_params& params);

void hive_print_usage(const char* prog, const hive_params& params);

// Generates an agent id when none was given
void hive_params_finalize(hive_params& params);

broker_config hive_params_to_broker_config(const hive_params& params);
failure_policy hive_params_to_failure_policy(const hive_params& params);

} // namespace hive
