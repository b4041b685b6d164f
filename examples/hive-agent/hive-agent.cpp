// Fleet agent over AMQP
// Runs one role (worker, team-leader, collaborator, coordinator, monitor)
// against a RabbitMQ broker until interrupted

#include "../../common/log.h"
#include "../../common/hive/params.h"
#include "../../common/hive/connection.h"
#include "../../common/hive/client.h"
#include "../../common/hive/orchestrator.h"
#include "../../common/hive/voting.h"
#include "../../common/hive/amqp_channel.h"

#include <signal.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace hive;

static std::atomic<bool> g_shutdown_requested{false};

static void signal_handler(int) {
    g_shutdown_requested = true;
}

// Logs connection events the way an operator wants to see them
class connection_logger : public connection_listener {
public:
    void on_disconnected(const std::string& reason) override {
        LOG_WRN("agent: disconnected (%s)\n", reason.c_str());
    }

    void on_max_reconnect(int attempts) override {
        LOG_ERR("agent: giving up after %d reconnect attempts\n", attempts);
        g_shutdown_requested = true;
    }
};

// Deterministic ballot: first declared option, full ranking, whole budget
static std::optional<vote_payload> default_ballot(const brainstorm_payload& session) {
    if (session.options.empty()) {
        return std::nullopt;
    }
    vote_payload vote;
    voting_algorithm algorithm = VOTING_ALGORITHM_SIMPLE_MAJORITY;
    voting_algorithm_from_string(session.algorithm, algorithm);
    switch (algorithm) {
        case VOTING_ALGORITHM_RANKED_CHOICE:
            vote.rankings = session.options;
            break;
        case VOTING_ALGORITHM_QUADRATIC:
            vote.allocation[session.options.front()] = session.tokens_per_agent;
            break;
        default:
            vote.choice = session.options.front();
            break;
    }
    vote.confidence = 0.5;
    return vote;
}

int main(int argc, char ** argv) {
    hive_params params = hive_default_params();

    try {
        hive_params_from_env(params);
    } catch (const validation_error & e) {
        LOG_ERR("%s\n", e.what());
        return 1;
    }
    if (!hive_params_parse(argc, argv, params)) {
        return 1;
    }
    hive_params_finalize(params);

    common_log_set_verbosity_thold(params.verbosity);
    if (!params.log_file.empty()) {
        common_log_set_file(common_log_main(), params.log_file.c_str());
    }

    agent_role role;
    if (!agent_role_from_string(params.role, role)) {
        LOG_ERR("unknown role '%s'\n", params.role.c_str());
        return 1;
    }

    connection_manager conn(amqp_channel_factory(),
                            hive_params_to_broker_config(params),
                            hive_params_to_failure_policy(params),
                            params.auto_reconnect);
    connection_logger logger;
    conn.add_listener(&logger);

    hive_client client(conn, params.agent_id);
    task_orchestrator orch(client, role, params.agent_name);
    auto engine = std::make_shared<voting_engine>(params.agent_id);
    orch.set_collaboration(params.collaboration_timeout_ms, params.required_responses);
    orch.set_vote_responder(default_ballot);

    const bool runs_votes = role == AGENT_ROLE_TEAM_LEADER || role == AGENT_ROLE_COORDINATOR;
    if (runs_votes) {
        orch.attach_voting(engine);
    }

    try {
        conn.connect();
    } catch (const connection_error & e) {
        LOG_ERR("agent: %s\n", e.what());
        conn.remove_listener(&logger);
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    LOG_INF("agent: %s (%s) running as %s\n", params.agent_name.c_str(), params.agent_id.c_str(), params.role.c_str());

    orch.start();
    client.start(params.poll_interval_ms);
    if (runs_votes) {
        engine->start_ticker();
    }

    while (!g_shutdown_requested && client.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INF("agent: shutting down\n");
    engine->stop_ticker();
    orch.shutdown();

    const auto stats = orch.get_stats();
    LOG_INF("agent: tasks received %lld, completed %lld, failed %lld, results %lld\n",
            (long long) stats.tasks_received, (long long) stats.tasks_completed,
            (long long) stats.tasks_failed, (long long) stats.total_results);

    conn.remove_listener(&logger);
    return 0;
}
