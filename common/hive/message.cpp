#include "message.h"
#include "failure.h"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

namespace hive {

// Helper function to generate UUID v4
std::string generate_uuid() {
    static thread_local std::mt19937 gen(std::random_device{}());
    static const char* hex = "0123456789abcdef";
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    for (int i = 0; i < 8; i++) ss << hex[dis(gen)];
    ss << "-";
    for (int i = 0; i < 4; i++) ss << hex[dis(gen)];
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << hex[dis(gen)];
    ss << "-";
    ss << hex[dis2(gen)];
    for (int i = 0; i < 3; i++) ss << hex[dis(gen)];
    ss << "-";
    for (int i = 0; i < 12; i++) ss << hex[dis(gen)];
    return ss.str();
}

// Get current timestamp in milliseconds
int64_t get_timestamp_ms() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

bool is_valid_utf8(const std::string& str) {
    try {
        json(str).dump();
    } catch (const json::type_error &) {
        return false;
    }
    return true;
}

const char* envelope_type_to_string(envelope_type type) {
    switch (type) {
        case ENVELOPE_TYPE_TASK: return "task";
        case ENVELOPE_TYPE_BRAINSTORM: return "brainstorm";
        case ENVELOPE_TYPE_RESULT: return "result";
        case ENVELOPE_TYPE_STATUS: return "status";
        case ENVELOPE_TYPE_VOTE: return "vote";
        default: return "unknown";
    }
}

bool envelope_type_from_string(const std::string& str, envelope_type& out) {
    if (str == "task") { out = ENVELOPE_TYPE_TASK; return true; }
    if (str == "brainstorm") { out = ENVELOPE_TYPE_BRAINSTORM; return true; }
    if (str == "result") { out = ENVELOPE_TYPE_RESULT; return true; }
    if (str == "status") { out = ENVELOPE_TYPE_STATUS; return true; }
    if (str == "vote") { out = ENVELOPE_TYPE_VOTE; return true; }
    return false;
}

// Name of the field holding the payload for each envelope type
static const char* payload_field(envelope_type type) {
    switch (type) {
        case ENVELOPE_TYPE_TASK: return "task";
        case ENVELOPE_TYPE_BRAINSTORM: return "message";
        case ENVELOPE_TYPE_RESULT: return "result";
        case ENVELOPE_TYPE_STATUS: return "status";
        case ENVELOPE_TYPE_VOTE: return "vote";
        default: return "payload";
    }
}

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

//
// equality
//

bool task_payload::operator==(const task_payload& o) const {
    return title == o.title && description == o.description && priority == o.priority &&
           assigned_by == o.assigned_by && assigned_at == o.assigned_at &&
           requires_collaboration == o.requires_collaboration &&
           collaboration_question == o.collaboration_question &&
           required_agents == o.required_agents && retry_count == o.retry_count &&
           context == o.context;
}

bool brainstorm_payload::operator==(const brainstorm_payload& o) const {
    return session_id == o.session_id && topic == o.topic && question == o.question &&
           initiated_by == o.initiated_by && required_agents == o.required_agents &&
           kind == o.kind && options == o.options && algorithm == o.algorithm &&
           deadline == o.deadline && tokens_per_agent == o.tokens_per_agent;
}

bool result_payload::operator==(const result_payload& o) const {
    return kind == o.kind && task_id == o.task_id && session_id == o.session_id &&
           status == o.status && output == o.output && processed_by == o.processed_by &&
           completed_at == o.completed_at && duration_ms == o.duration_ms && data == o.data;
}

bool status_payload::operator==(const status_payload& o) const {
    return agent_id == o.agent_id && agent_type == o.agent_type && event == o.event && data == o.data;
}

bool vote_payload::operator==(const vote_payload& o) const {
    return session_id == o.session_id && agent_id == o.agent_id && choice == o.choice &&
           rankings == o.rankings && allocation == o.allocation &&
           confidence == o.confidence && agent_level == o.agent_level;
}

bool envelope::operator==(const envelope& o) const {
    return id == o.id && from == o.from && timestamp == o.timestamp && payload == o.payload;
}

//
// payload codecs
//

static json task_to_json(const task_payload& t) {
    json j;
    j["title"] = t.title;
    j["description"] = t.description;
    j["priority"] = t.priority;
    j["assignedBy"] = t.assigned_by;
    j["assignedAt"] = t.assigned_at;
    j["requiresCollaboration"] = t.requires_collaboration;
    if (!t.collaboration_question.empty()) {
        j["collaborationQuestion"] = t.collaboration_question;
    }
    if (!t.required_agents.empty()) {
        j["requiredAgents"] = t.required_agents;
    }
    j["retryCount"] = t.retry_count;
    j["context"] = t.context;
    return j;
}

static task_payload task_from_json(const json& j) {
    task_payload t;
    t.title = j.value("title", "");
    t.description = j.value("description", "");
    t.priority = j.value("priority", "normal");
    t.assigned_by = j.value("assignedBy", "");
    t.assigned_at = j.value("assignedAt", int64_t(0));
    t.requires_collaboration = j.value("requiresCollaboration", false);
    t.collaboration_question = j.value("collaborationQuestion", "");
    t.required_agents = j.value("requiredAgents", std::vector<std::string>());
    t.retry_count = j.value("retryCount", 0);
    t.context = j.value("context", json::object());
    return t;
}

static json brainstorm_to_json(const brainstorm_payload& b) {
    json j;
    j["sessionId"] = b.session_id;
    j["topic"] = b.topic;
    j["question"] = b.question;
    j["initiatedBy"] = b.initiated_by;
    j["requiredAgents"] = b.required_agents;
    j["type"] = b.kind;
    if (b.is_voting_session()) {
        j["options"] = b.options;
        j["algorithm"] = b.algorithm;
        j["deadline"] = b.deadline;
        j["tokensPerAgent"] = b.tokens_per_agent;
    }
    return j;
}

static brainstorm_payload brainstorm_from_json(const json& j) {
    brainstorm_payload b;
    b.session_id = j.value("sessionId", "");
    b.topic = j.value("topic", "");
    b.question = j.value("question", "");
    b.initiated_by = j.value("initiatedBy", "");
    b.required_agents = j.value("requiredAgents", std::vector<std::string>());
    b.kind = j.value("type", "brainstorm");
    b.options = j.value("options", std::vector<std::string>());
    b.algorithm = j.value("algorithm", "");
    b.deadline = j.value("deadline", int64_t(0));
    b.tokens_per_agent = j.value("tokensPerAgent", 0);
    return b;
}

static json result_to_json(const result_payload& r) {
    json j;
    j["type"] = r.kind;
    if (!r.task_id.empty()) {
        j["taskId"] = r.task_id;
    }
    if (!r.session_id.empty()) {
        j["sessionId"] = r.session_id;
    }
    j["status"] = r.status;
    j["output"] = r.output;
    j["processedBy"] = r.processed_by;
    j["completedAt"] = r.completed_at;
    j["duration"] = r.duration_ms;
    j["data"] = r.data;
    return j;
}

static result_payload result_from_json(const json& j) {
    result_payload r;
    r.kind = j.value("type", "task_result");
    r.task_id = j.value("taskId", "");
    r.session_id = j.value("sessionId", "");
    r.status = j.value("status", "");
    r.output = j.value("output", "");
    r.processed_by = j.value("processedBy", "");
    r.completed_at = j.value("completedAt", int64_t(0));
    r.duration_ms = j.value("duration", int64_t(0));
    r.data = j.value("data", json::object());
    return r;
}

static json status_to_json(const status_payload& s) {
    json j;
    j["agentId"] = s.agent_id;
    j["agentType"] = s.agent_type;
    j["event"] = s.event;
    j["data"] = s.data;
    return j;
}

static status_payload status_from_json(const json& j) {
    status_payload s;
    s.agent_id = j.value("agentId", "");
    s.agent_type = j.value("agentType", "");
    s.event = j.value("event", "");
    s.data = j.value("data", json::object());
    return s;
}

static json vote_to_json(const vote_payload& v) {
    json j;
    j["sessionId"] = v.session_id;
    j["agentId"] = v.agent_id;
    if (!v.choice.empty()) {
        j["choice"] = v.choice;
    }
    if (!v.rankings.empty()) {
        j["rankings"] = v.rankings;
    }
    if (!v.allocation.empty()) {
        j["allocation"] = v.allocation;
    }
    if (v.confidence) {
        j["confidence"] = *v.confidence;
    }
    j["agentLevel"] = v.agent_level;
    return j;
}

static vote_payload vote_from_json(const json& j) {
    vote_payload v;
    v.session_id = j.value("sessionId", "");
    v.agent_id = j.value("agentId", "");
    v.choice = j.value("choice", "");
    v.rankings = j.value("rankings", std::vector<std::string>());
    v.allocation = j.value("allocation", std::map<std::string, double>());
    if (j.contains("confidence") && !j["confidence"].is_null()) {
        v.confidence = j["confidence"].get<double>();
    }
    v.agent_level = j.value("agentLevel", 0);
    return v;
}

//
// envelope
//

envelope_type envelope::type() const {
    return std::visit(overloaded{
        [](const task_payload&)       { return ENVELOPE_TYPE_TASK; },
        [](const brainstorm_payload&) { return ENVELOPE_TYPE_BRAINSTORM; },
        [](const result_payload&)     { return ENVELOPE_TYPE_RESULT; },
        [](const status_payload&)     { return ENVELOPE_TYPE_STATUS; },
        [](const vote_payload&)       { return ENVELOPE_TYPE_VOTE; },
    }, payload);
}

envelope envelope::make(const std::string& from, envelope_payload payload) {
    envelope env;
    env.id = generate_uuid();
    env.from = from;
    env.timestamp = get_timestamp_ms();
    env.payload = std::move(payload);
    return env;
}

static void require(bool cond, const char* what) {
    if (!cond) {
        throw validation_error(what);
    }
}

void envelope::validate() const {
    require(!id.empty(), "envelope id is required");
    require(!from.empty(), "envelope sender is required");

    std::visit(overloaded{
        [](const task_payload& t) {
            require(!t.title.empty(), "task title is required");
            require(t.retry_count >= 0, "task retryCount must be non-negative");
        },
        [](const brainstorm_payload& b) {
            require(!b.session_id.empty(), "brainstorm sessionId is required");
            require(!b.topic.empty(), "brainstorm topic is required");
            require(!b.question.empty(), "brainstorm question is required");
            if (b.is_voting_session()) {
                require(b.options.size() >= 2, "voting session needs at least two options");
            }
        },
        [](const result_payload& r) {
            require(!r.task_id.empty() || !r.session_id.empty(), "result needs a taskId or sessionId");
            require(!r.status.empty(), "result status is required");
        },
        [](const status_payload& s) {
            require(!s.agent_id.empty(), "status agentId is required");
            require(!s.event.empty(), "status event is required");
        },
        [](const vote_payload& v) {
            require(!v.session_id.empty(), "vote sessionId is required");
            require(!v.agent_id.empty(), "vote agentId is required");
            require(!v.choice.empty() || !v.rankings.empty() || !v.allocation.empty(),
                    "vote needs a choice, rankings or allocation");
        },
    }, payload);
}

std::string envelope::serialize() const {
    json j;
    j["id"] = id;
    j["type"] = envelope_type_to_string(type());
    j["from"] = from;
    j["timestamp"] = timestamp;
    j[payload_field(type())] = std::visit(overloaded{
        [](const task_payload& t)       { return task_to_json(t); },
        [](const brainstorm_payload& b) { return brainstorm_to_json(b); },
        [](const result_payload& r)     { return result_to_json(r); },
        [](const status_payload& s)     { return status_to_json(s); },
        [](const vote_payload& v)       { return vote_to_json(v); },
    }, payload);
    return j.dump();
}

envelope envelope::parse(const std::string& bytes) {
    json j;
    try {
        j = json::parse(bytes);
    } catch (const json::parse_error& e) {
        throw validation_error(std::string("malformed envelope: ") + e.what());
    }

    if (!j.is_object()) {
        throw validation_error("envelope must be a JSON object");
    }

    envelope env;
    try {
        env.id = j.value("id", "");
        env.from = j.value("from", "");
        env.timestamp = j.value("timestamp", int64_t(0));

        const std::string type_str = j.value("type", "");
        envelope_type type;
        if (!envelope_type_from_string(type_str, type)) {
            throw validation_error("unknown envelope type: '" + type_str + "'");
        }

        const char* field = payload_field(type);
        auto it = j.find(field);
        if (it == j.end() || !it->is_object()) {
            throw validation_error(std::string("envelope is missing its '") + field + "' body");
        }

        switch (type) {
            case ENVELOPE_TYPE_TASK:       env.payload = task_from_json(*it);       break;
            case ENVELOPE_TYPE_BRAINSTORM: env.payload = brainstorm_from_json(*it); break;
            case ENVELOPE_TYPE_RESULT:     env.payload = result_from_json(*it);     break;
            case ENVELOPE_TYPE_STATUS:     env.payload = status_from_json(*it);     break;
            case ENVELOPE_TYPE_VOTE:       env.payload = vote_from_json(*it);       break;
        }
    } catch (const json::exception& e) {
        throw validation_error(std::string("malformed envelope field: ") + e.what());
    }

    env.validate();
    return env;
}

} // namespace hive
