#pragma once

#include "client.h"
#include "router.h"
#include "voting.h"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <functional>

namespace hive {

// Agent roles, each enabling a fixed set of consumers
enum agent_role {
    AGENT_ROLE_WORKER,          // tasks, brainstorm
    AGENT_ROLE_TEAM_LEADER,     // results, status
    AGENT_ROLE_COLLABORATOR,    // brainstorm, tasks
    AGENT_ROLE_COORDINATOR,     // results, status, tasks
    AGENT_ROLE_MONITOR          // status, results
};

const char* agent_role_to_string(agent_role role);
bool agent_role_from_string(const std::string& str, agent_role& out);

// Per-task lifecycle
enum task_state {
    TASK_STATE_QUEUED,
    TASK_STATE_DELIVERED,
    TASK_STATE_COMPLETED,
    TASK_STATE_RETRY_REQUEUED,
    TASK_STATE_DEAD_LETTERED
};

const char* task_state_to_string(task_state state);

// queued -> delivered -> {completed | retry-requeued | dead-lettered},
// retry-requeued -> {delivered | dead-lettered}
bool task_state_transition_allowed(task_state from, task_state to);

struct task_record {
    std::string id;
    std::string title;
    task_state state = TASK_STATE_QUEUED;
    int deliveries = 0;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    std::string last_error;
    std::string output;
};

struct brainstorm_session {
    std::string id;
    std::string topic;
    std::string question;
    int64_t initiated_at = 0;
    int required_responses = 0;
    std::vector<result_payload> responses;
};

struct orchestrator_stats {
    int64_t tasks_received;
    int64_t tasks_completed;
    int64_t tasks_failed;
    int64_t brainstorms_participated;
    int64_t results_published;
    int64_t active_tasks;
    int64_t active_brainstorms;
    int64_t total_results;
};

// Task distribution, brainstorm collaboration and vote relay for one agent
class task_orchestrator {
public:
    // Returns the task output, throws on failure
    using task_executor = std::function<std::string(const task_payload&, const std::vector<result_payload>& ideas)>;
    using brainstorm_responder = std::function<std::string(const brainstorm_payload&)>;
    using vote_responder = std::function<std::optional<vote_payload>(const brainstorm_payload&)>;

    task_orchestrator(hive_client& client, agent_role role, const std::string& agent_name = "");
    ~task_orchestrator();

    task_orchestrator(const task_orchestrator&) = delete;
    task_orchestrator& operator=(const task_orchestrator&) = delete;

    void set_task_executor(task_executor fn);
    void set_brainstorm_responder(brainstorm_responder fn);
    void set_vote_responder(vote_responder fn);

    // Bound on the brainstorm wait inside a collaborative task
    void set_collaboration(int64_t timeout_ms, int required_responses);

    // Wire a voting engine: session broadcasts and results go through the
    // client, vote envelopes from the results queue are cast into it.
    // The orchestrator shares ownership; the engine's callbacks become no-ops
    // once the orchestrator is destroyed.
    void attach_voting(std::shared_ptr<voting_engine> engine);

    // Start the role's consumers and announce the agent
    void start();

    // Publish the shutdown status, stop consuming and close the connection
    void shutdown();

    // Publish to the work queue, returns the task id
    std::string assign_task(task_payload task);

    // Open a brainstorm and broadcast it, returns the session id
    std::string initiate_brainstorm(const std::string& topic, const std::string& question, int required_responses);

    // Wait until the session has its required responses or timeout_ms passes
    std::vector<result_payload> wait_for_responses(const std::string& session_id, int64_t timeout_ms);

    // Open a voting session through the attached engine
    std::string initiate_vote(voting_config config);

    // Handlers, normally reached through router()
    void handle_task(const envelope& env, delivery_controls& controls);
    void handle_brainstorm_message(const envelope& env, delivery_controls& controls);
    void handle_result(const envelope& env, delivery_controls& controls);
    void handle_vote(const envelope& env, delivery_controls& controls);
    void handle_status_update(const envelope& env, delivery_controls& controls);

    // Record a delivery outcome for a task
    void on_task_outcome(const std::string& task_id, delivery_outcome outcome);

    std::optional<task_record> get_task(const std::string& task_id) const;
    std::vector<task_record> get_tasks() const;
    std::optional<brainstorm_session> get_brainstorm(const std::string& session_id) const;

    // Last status seen per agent id
    std::map<std::string, status_payload> get_known_agents() const;

    orchestrator_stats get_stats() const;

    agent_role role() const;
    message_router& router();

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace hive
