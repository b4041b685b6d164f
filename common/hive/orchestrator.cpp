#include "orchestrator.h"
#include "log.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace hive {

const char* agent_role_to_string(agent_role role) {
    switch (role) {
        case AGENT_ROLE_WORKER: return "worker";
        case AGENT_ROLE_TEAM_LEADER: return "team-leader";
        case AGENT_ROLE_COLLABORATOR: return "collaborator";
        case AGENT_ROLE_COORDINATOR: return "coordinator";
        case AGENT_ROLE_MONITOR: return "monitor";
        default: return "unknown";
    }
}

bool agent_role_from_string(const std::string& str, agent_role& out) {
    static const agent_role roles[] = {
        AGENT_ROLE_WORKER, AGENT_ROLE_TEAM_LEADER, AGENT_ROLE_COLLABORATOR,
        AGENT_ROLE_COORDINATOR, AGENT_ROLE_MONITOR,
    };
    for (agent_role role : roles) {
        if (str == agent_role_to_string(role)) {
            out = role;
            return true;
        }
    }
    return false;
}

const char* task_state_to_string(task_state state) {
    switch (state) {
        case TASK_STATE_QUEUED: return "queued";
        case TASK_STATE_DELIVERED: return "delivered";
        case TASK_STATE_COMPLETED: return "completed";
        case TASK_STATE_RETRY_REQUEUED: return "retry-requeued";
        case TASK_STATE_DEAD_LETTERED: return "dead-lettered";
        default: return "unknown";
    }
}

bool task_state_transition_allowed(task_state from, task_state to) {
    switch (from) {
        case TASK_STATE_QUEUED:
            return to == TASK_STATE_DELIVERED;
        case TASK_STATE_DELIVERED:
            return to == TASK_STATE_COMPLETED || to == TASK_STATE_RETRY_REQUEUED || to == TASK_STATE_DEAD_LETTERED;
        case TASK_STATE_RETRY_REQUEUED:
            return to == TASK_STATE_DELIVERED || to == TASK_STATE_DEAD_LETTERED;
        default:
            return false;
    }
}

struct task_orchestrator::impl {
    // Reached from engine callbacks; owner is cleared when the orchestrator goes
    struct vote_link {
        std::mutex mutex;
        impl* owner = nullptr;
    };

    hive_client& client;
    agent_role role;
    std::string agent_name;
    message_router router;
    std::shared_ptr<voting_engine> engine;
    std::shared_ptr<vote_link> link = std::make_shared<vote_link>();

    task_executor executor;
    brainstorm_responder responder;
    vote_responder voter;

    int64_t collaboration_timeout_ms = 30000;
    int required_responses = 1;

    std::map<std::string, task_record> tasks;
    std::map<std::string, brainstorm_session> brainstorms;
    std::map<std::string, status_payload> known_agents;
    mutable std::mutex mutex;
    std::condition_variable responses_cv;

    std::atomic<int64_t> tasks_received{0};
    std::atomic<int64_t> tasks_completed{0};
    std::atomic<int64_t> tasks_failed{0};
    std::atomic<int64_t> brainstorms_participated{0};
    std::atomic<int64_t> results_published{0};
    std::atomic<int64_t> active_tasks{0};
    std::atomic<int64_t> total_results{0};

    bool started = false;
    bool stopped = false;

    impl(hive_client& c, agent_role r, const std::string& name)
        : client(c), role(r), agent_name(name.empty() ? c.agent_id() : name) {
        link->owner = this;
        executor = [](const task_payload& task, const std::vector<result_payload>& ideas) {
            std::string output = "Processed: " + task.title;
            if (!ideas.empty()) {
                output += " (" + std::to_string(ideas.size()) + " idea(s) considered)";
            }
            return output;
        };
        responder = [this](const brainstorm_payload& msg) {
            return agent_name + " suggests approaching '" + msg.topic + "' step by step";
        };
    }

    const std::string& agent_id() const { return client.agent_id(); }

    // Informational: failures are logged, never propagated
    void status(const std::string& event, const std::string& routing_key, json data = json::object()) {
        status_payload s;
        s.agent_id = agent_id();
        s.agent_type = agent_role_to_string(role);
        s.event = event;
        s.data = std::move(data);
        try {
            client.publish_status(s, routing_key);
        } catch (const error & e) {
            LOG_WRN("orchestrator: status '%s' not published: %s\n", event.c_str(), e.what());
        }
    }

    // Caller holds the mutex
    bool transition(task_record& record, task_state to) {
        if (!task_state_transition_allowed(record.state, to)) {
            LOG_WRN("orchestrator: task %s refused transition %s -> %s\n", record.id.c_str(),
                    task_state_to_string(record.state), task_state_to_string(to));
            return false;
        }
        LOG_DBG("orchestrator: task %s %s -> %s\n", record.id.c_str(),
                task_state_to_string(record.state), task_state_to_string(to));
        record.state = to;
        record.updated_at = get_timestamp_ms();
        return true;
    }

    task_record& track(const std::string& id, const std::string& title) {
        auto it = tasks.find(id);
        if (it != tasks.end()) {
            return it->second;
        }
        task_record record;
        record.id = id;
        record.title = title;
        record.created_at = get_timestamp_ms();
        record.updated_at = record.created_at;
        return tasks.emplace(id, record).first->second;
    }
};

task_orchestrator::task_orchestrator(hive_client& client, agent_role role, const std::string& agent_name)
    : pimpl(std::make_unique<impl>(client, role, agent_name)) {
    pimpl->router.on_task([this](const envelope& env, const task_payload&, delivery_controls& c) {
        handle_task(env, c);
    });
    pimpl->router.on_brainstorm([this](const envelope& env, const brainstorm_payload&, delivery_controls& c) {
        handle_brainstorm_message(env, c);
    });
    pimpl->router.on_result([this](const envelope& env, const result_payload&, delivery_controls& c) {
        handle_result(env, c);
    });
    pimpl->router.on_vote([this](const envelope& env, const vote_payload&, delivery_controls& c) {
        handle_vote(env, c);
    });
    pimpl->router.on_status([this](const envelope& env, const status_payload&, delivery_controls& c) {
        handle_status_update(env, c);
    });

    client.set_outcome_listener([this](const std::string& id, delivery_outcome outcome) {
        on_task_outcome(id, outcome);
    });
}

task_orchestrator::~task_orchestrator() {
    pimpl->client.set_outcome_listener(nullptr);
    std::lock_guard<std::mutex> lock(pimpl->link->mutex);
    pimpl->link->owner = nullptr;
}

void task_orchestrator::set_task_executor(task_executor fn) {
    pimpl->executor = std::move(fn);
}

void task_orchestrator::set_brainstorm_responder(brainstorm_responder fn) {
    pimpl->responder = std::move(fn);
}

void task_orchestrator::set_vote_responder(vote_responder fn) {
    pimpl->voter = std::move(fn);
}

void task_orchestrator::set_collaboration(int64_t timeout_ms, int required_responses) {
    pimpl->collaboration_timeout_ms = timeout_ms;
    pimpl->required_responses = required_responses;
}

void task_orchestrator::attach_voting(std::shared_ptr<voting_engine> engine) {
    if (!engine) {
        throw validation_error("attach_voting: engine is null");
    }
    pimpl->engine = std::move(engine);

    std::weak_ptr<impl::vote_link> weak = pimpl->link;
    pimpl->engine->set_broadcaster([weak](const brainstorm_payload& announcement) {
        auto link = weak.lock();
        if (!link) return;
        std::lock_guard<std::mutex> lock(link->mutex);
        if (!link->owner) {
            LOG_DBG("orchestrator: gone, session %s not broadcast\n", announcement.session_id.c_str());
            return;
        }
        link->owner->client.broadcast_brainstorm(announcement);
    });
    pimpl->engine->set_result_publisher([weak](const result_payload& result) {
        auto link = weak.lock();
        if (!link) return;
        std::lock_guard<std::mutex> lock(link->mutex);
        if (!link->owner) {
            LOG_DBG("orchestrator: gone, result of %s not published\n", result.session_id.c_str());
            return;
        }
        link->owner->client.publish_result(result);
        link->owner->results_published++;
    });
}

void task_orchestrator::start() {
    if (pimpl->started) {
        return;
    }
    pimpl->started = true;

    auto route = [this](const envelope& env, delivery_controls& c) {
        pimpl->router.route(env, c);
    };

    auto& client = pimpl->client;
    switch (pimpl->role) {
        case AGENT_ROLE_WORKER:
            client.consume_tasks(route);
            client.listen_brainstorm(route);
            break;
        case AGENT_ROLE_TEAM_LEADER:
            client.consume_results(route);
            client.subscribe_status(route);
            break;
        case AGENT_ROLE_COLLABORATOR:
            client.listen_brainstorm(route);
            client.consume_tasks(route);
            break;
        case AGENT_ROLE_COORDINATOR:
            client.consume_results(route);
            client.subscribe_status(route);
            client.consume_tasks(route);
            break;
        case AGENT_ROLE_MONITOR:
            client.subscribe_status(route);
            client.consume_results(route);
            break;
    }

    LOG_INF("orchestrator: %s started as %s\n", pimpl->agent_name.c_str(), agent_role_to_string(pimpl->role));
    pimpl->status("connected", "agent.status.connected", {{"name", pimpl->agent_name}});
}

void task_orchestrator::shutdown() {
    if (pimpl->stopped) {
        return;
    }
    pimpl->stopped = true;

    const auto s = get_stats();
    pimpl->status("shutdown", "agent.status.shutdown", {
        {"tasksCompleted", s.tasks_completed},
        {"tasksFailed", s.tasks_failed},
    });

    pimpl->status("disconnected", "agent.status.disconnected");

    pimpl->client.stop();
    pimpl->client.connection().close();
    LOG_INF("orchestrator: %s shut down\n", pimpl->agent_name.c_str());
}

std::string task_orchestrator::assign_task(task_payload task) {
    task.assigned_by = pimpl->agent_id();
    if (task.assigned_at == 0) {
        task.assigned_at = get_timestamp_ms();
    }

    const std::string id = pimpl->client.publish_task(task);
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->track(id, task.title);
    }

    LOG_INF("orchestrator: assigned task %s '%s'\n", id.c_str(), task.title.c_str());
    pimpl->status("task.assigned", "agent.status.task.assigned", {
        {"taskId", id}, {"title", task.title}, {"priority", task.priority},
    });
    return id;
}

std::string task_orchestrator::initiate_brainstorm(const std::string& topic, const std::string& question,
                                                   int required_responses) {
    brainstorm_payload msg;
    msg.session_id = generate_uuid();
    msg.topic = topic;
    msg.question = question.empty() ? topic : question;
    msg.initiated_by = pimpl->agent_id();

    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        brainstorm_session session;
        session.id = msg.session_id;
        session.topic = msg.topic;
        session.question = msg.question;
        session.initiated_at = get_timestamp_ms();
        session.required_responses = required_responses;
        pimpl->brainstorms[session.id] = session;
    }

    pimpl->client.broadcast_brainstorm(msg);
    LOG_INF("orchestrator: brainstorm %s on '%s'\n", msg.session_id.c_str(), topic.c_str());
    return msg.session_id;
}

std::vector<result_payload> task_orchestrator::wait_for_responses(const std::string& session_id, int64_t timeout_ms) {
    std::unique_lock<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->brainstorms.find(session_id);
    if (it == pimpl->brainstorms.end()) {
        return {};
    }

    pimpl->responses_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&]() {
        auto& s = pimpl->brainstorms[session_id];
        return static_cast<int>(s.responses.size()) >= s.required_responses;
    });

    auto& session = pimpl->brainstorms[session_id];
    if (static_cast<int>(session.responses.size()) < session.required_responses) {
        LOG_WRN("orchestrator: brainstorm %s timed out with %zu/%d responses\n",
                session_id.c_str(), session.responses.size(), session.required_responses);
    }
    return session.responses;
}

std::string task_orchestrator::initiate_vote(voting_config config) {
    if (!pimpl->engine) {
        throw session_error(ERROR_TYPE_SESSION_NOT_FOUND, "no voting engine attached");
    }
    if (config.initiated_by.empty()) {
        config.initiated_by = pimpl->agent_id();
    }
    return pimpl->engine->initiate_vote(config);
}

void task_orchestrator::handle_task(const envelope& env, delivery_controls& controls) {
    const auto& task = std::get<task_payload>(env.payload);

    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto& record = pimpl->track(env.id, task.title);
        record.deliveries++;
        pimpl->transition(record, TASK_STATE_DELIVERED);
    }
    pimpl->tasks_received++;
    pimpl->active_tasks++;

    LOG_INF("orchestrator: task %s '%s' from %s\n", env.id.c_str(), task.title.c_str(), env.from.c_str());
    pimpl->status("task.started", "agent.status.task.started", {{"taskId", env.id}, {"title", task.title}});

    const int64_t started = get_timestamp_ms();
    std::string output;
    result_payload result;
    try {
        std::vector<result_payload> ideas;
        if (task.requires_collaboration) {
            const int required = task.required_agents.empty()
                ? pimpl->required_responses
                : static_cast<int>(task.required_agents.size());
            const std::string question = task.collaboration_question.empty()
                ? task.description : task.collaboration_question;
            const std::string sid = initiate_brainstorm(task.title, question, required);
            ideas = wait_for_responses(sid, pimpl->collaboration_timeout_ms);
        }
        output = pimpl->executor(task, ideas);

        result.kind = "task_result";
        result.task_id = env.id;
        result.status = "completed";
        result.output = output;
        result.processed_by = pimpl->agent_id();
        result.completed_at = get_timestamp_ms();
        result.duration_ms = result.completed_at - started;
        pimpl->client.publish_result(result);
        pimpl->results_published++;
    } catch (const std::exception & e) {
        pimpl->active_tasks--;
        pimpl->tasks_failed++;
        {
            std::lock_guard<std::mutex> lock(pimpl->mutex);
            pimpl->tasks[env.id].last_error = e.what();
        }
        pimpl->status("task.failed", "agent.status.task.failed", {{"taskId", env.id}, {"error", e.what()}});
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto& record = pimpl->tasks[env.id];
        record.output = output;
        pimpl->transition(record, TASK_STATE_COMPLETED);
    }
    pimpl->active_tasks--;
    pimpl->tasks_completed++;

    pimpl->status("task.completed", "agent.status.task.completed", {
        {"taskId", env.id}, {"durationMs", result.duration_ms},
    });
    controls.ack();
}

void task_orchestrator::on_task_outcome(const std::string& task_id, delivery_outcome outcome) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->tasks.find(task_id);
    if (it == pimpl->tasks.end()) {
        return;
    }
    auto& record = it->second;
    switch (outcome) {
        case DELIVERY_ACKED:
            if (record.state != TASK_STATE_COMPLETED) {
                pimpl->transition(record, TASK_STATE_COMPLETED);
            }
            break;
        case DELIVERY_REQUEUED:
            pimpl->transition(record, TASK_STATE_RETRY_REQUEUED);
            break;
        case DELIVERY_REJECTED:
            pimpl->transition(record, TASK_STATE_DEAD_LETTERED);
            break;
    }
}

void task_orchestrator::handle_brainstorm_message(const envelope& env, delivery_controls& controls) {
    const auto& msg = std::get<brainstorm_payload>(env.payload);
    if (env.from == pimpl->agent_id()) {
        controls.ack();
        return;
    }
    pimpl->brainstorms_participated++;

    if (msg.is_voting_session()) {
        std::optional<vote_payload> vote;
        if (pimpl->voter) {
            vote = pimpl->voter(msg);
        }
        if (vote) {
            vote->session_id = msg.session_id;
            vote->agent_id = pimpl->agent_id();
            pimpl->client.publish_vote(*vote);
            LOG_INF("orchestrator: voted in session %s\n", msg.session_id.c_str());
        } else {
            LOG_DBG("orchestrator: abstaining from session %s\n", msg.session_id.c_str());
        }
        controls.ack();
        return;
    }

    result_payload response;
    response.kind = "brainstorm_response";
    response.session_id = msg.session_id;
    response.status = "completed";
    response.output = pimpl->responder(msg);
    response.processed_by = pimpl->agent_id();
    response.completed_at = get_timestamp_ms();
    pimpl->client.publish_result(response);
    pimpl->results_published++;

    LOG_INF("orchestrator: answered brainstorm %s from %s\n", msg.session_id.c_str(), env.from.c_str());
    pimpl->status("result", "agent.status.result", {{"sessionId", msg.session_id}});
    controls.ack();
}

void task_orchestrator::handle_result(const envelope& env, delivery_controls& controls) {
    const auto& result = std::get<result_payload>(env.payload);
    pimpl->total_results++;

    if (result.kind == "brainstorm_response") {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->brainstorms.find(result.session_id);
        if (it != pimpl->brainstorms.end()) {
            it->second.responses.push_back(result);
            pimpl->responses_cv.notify_all();
        }
    } else if (result.kind == "voting_results") {
        LOG_INF("orchestrator: session %s finished %s, winner '%s'\n",
                result.session_id.c_str(), result.status.c_str(), result.output.c_str());
    } else {
        LOG_INF("orchestrator: task %s %s by %s\n",
                result.task_id.c_str(), result.status.c_str(), result.processed_by.c_str());
    }
    controls.ack();
}

void task_orchestrator::handle_vote(const envelope& env, delivery_controls& controls) {
    const auto& vote = std::get<vote_payload>(env.payload);
    if (!pimpl->engine || !pimpl->engine->has_session(vote.session_id)) {
        LOG_DBG("orchestrator: vote for foreign session %s ignored\n", vote.session_id.c_str());
        controls.ack();
        return;
    }
    try {
        pimpl->engine->cast_vote(vote.session_id, vote);
    } catch (const error & e) {
        LOG_WRN("orchestrator: vote from %s refused: %s\n", vote.agent_id.c_str(), e.what());
    }
    controls.ack();
}

void task_orchestrator::handle_status_update(const envelope& env, delivery_controls& controls) {
    const auto& s = std::get<status_payload>(env.payload);
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        pimpl->known_agents[s.agent_id] = s;
    }
    LOG_DBG("orchestrator: %s (%s) %s\n", s.agent_id.c_str(), s.agent_type.c_str(), s.event.c_str());
    controls.ack();
}

std::optional<task_record> task_orchestrator::get_task(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->tasks.find(task_id);
    if (it == pimpl->tasks.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<task_record> task_orchestrator::get_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    std::vector<task_record> out;
    for (const auto& [id, record] : pimpl->tasks) {
        out.push_back(record);
    }
    return out;
}

std::optional<brainstorm_session> task_orchestrator::get_brainstorm(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->brainstorms.find(session_id);
    if (it == pimpl->brainstorms.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, status_payload> task_orchestrator::get_known_agents() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->known_agents;
}

orchestrator_stats task_orchestrator::get_stats() const {
    orchestrator_stats s;
    s.tasks_received = pimpl->tasks_received;
    s.tasks_completed = pimpl->tasks_completed;
    s.tasks_failed = pimpl->tasks_failed;
    s.brainstorms_participated = pimpl->brainstorms_participated;
    s.results_published = pimpl->results_published;
    s.active_tasks = pimpl->active_tasks;
    s.total_results = pimpl->total_results;
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        int64_t open = 0;
        for (const auto& [id, session] : pimpl->brainstorms) {
            if (static_cast<int>(session.responses.size()) < session.required_responses) open++;
        }
        s.active_brainstorms = open;
    }
    return s;
}

agent_role task_orchestrator::role() const {
    return pimpl->role;
}

message_router& task_orchestrator::router() {
    return pimpl->router;
}

} // namespace hive
