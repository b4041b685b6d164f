#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <optional>
#include <variant>

namespace hive {

using json = nlohmann::ordered_json;

// Envelope types, one per payload kind
enum envelope_type {
    ENVELOPE_TYPE_TASK,
    ENVELOPE_TYPE_BRAINSTORM,
    ENVELOPE_TYPE_RESULT,
    ENVELOPE_TYPE_STATUS,
    ENVELOPE_TYPE_VOTE
};

// Convert envelope type to its wire name ("task", "brainstorm", ...)
const char* envelope_type_to_string(envelope_type type);

// Parse a wire name, returns false for unknown names
bool envelope_type_from_string(const std::string& str, envelope_type& out);

// Work item distributed over the task queue
struct task_payload {
    std::string title;
    std::string description;
    std::string priority = "normal";   // low, normal, high, urgent, critical
    std::string assigned_by;
    int64_t assigned_at = 0;
    bool requires_collaboration = false;
    std::string collaboration_question;
    std::vector<std::string> required_agents;
    int retry_count = 0;
    json context = json::object();

    bool operator==(const task_payload& other) const;
};

// Broadcast to every agent; also used to announce voting sessions
struct brainstorm_payload {
    std::string session_id;
    std::string topic;
    std::string question;
    std::string initiated_by;
    std::vector<std::string> required_agents;

    // "brainstorm" or "voting_session"
    std::string kind = "brainstorm";
    std::vector<std::string> options;
    std::string algorithm;
    int64_t deadline = 0;
    int tokens_per_agent = 0;

    bool is_voting_session() const { return kind == "voting_session"; }

    bool operator==(const brainstorm_payload& other) const;
};

// Task outcome, brainstorm response or voting result
struct result_payload {
    // "task_result", "brainstorm_response" or "voting_results"
    std::string kind = "task_result";
    std::string task_id;
    std::string session_id;
    std::string status;
    std::string output;
    std::string processed_by;
    int64_t completed_at = 0;
    int64_t duration_ms = 0;
    json data = json::object();

    bool operator==(const result_payload& other) const;
};

// Agent lifecycle / activity event
struct status_payload {
    std::string agent_id;
    std::string agent_type;
    std::string event;
    json data = json::object();

    bool operator==(const status_payload& other) const;
};

// A ballot for a voting session
struct vote_payload {
    std::string session_id;
    std::string agent_id;
    std::string choice;
    std::vector<std::string> rankings;
    std::map<std::string, double> allocation;
    std::optional<double> confidence;
    int agent_level = 0;

    bool operator==(const vote_payload& other) const;
};

using envelope_payload = std::variant<
    task_payload,
    brainstorm_payload,
    result_payload,
    status_payload,
    vote_payload>;

// Uniform wrapper around every wire message
struct envelope {
    std::string id;              // UUID
    std::string from;            // Sender agent id
    int64_t timestamp = 0;       // Unix epoch ms
    envelope_payload payload;

    envelope_type type() const;

    // Fresh id and timestamp
    static envelope make(const std::string& from, envelope_payload payload);

    // Check the per-type required fields, throws validation_error
    void validate() const;

    // Serialize to JSON text
    std::string serialize() const;

    // Parse and validate JSON text, throws validation_error
    static envelope parse(const std::string& bytes);

    bool operator==(const envelope& other) const;
    bool operator!=(const envelope& other) const { return !(*this == other); }
};

// Generate UUID for messages and sessions
std::string generate_uuid();

// Get current timestamp in milliseconds
int64_t get_timestamp_ms();

// True when `str` can go on the wire as a JSON string
bool is_valid_utf8(const std::string& str);

} // namespace hive
