#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>

namespace hive {

// Error types
enum error_type {
    ERROR_TYPE_NONE,
    ERROR_TYPE_CONNECTION,       // Broker unreachable
    ERROR_TYPE_CHANNEL,          // Channel lost, transient
    ERROR_TYPE_MAX_RECONNECT,    // Reconnect budget exhausted
    ERROR_TYPE_VALIDATION,       // Malformed or incomplete envelope
    ERROR_TYPE_SESSION_NOT_FOUND,
    ERROR_TYPE_SESSION_CLOSED,
    ERROR_TYPE_HANDLER,          // Handler threw while processing a delivery
    ERROR_TYPE_RETRY_EXHAUSTED,
    ERROR_TYPE_UNKNOWN
};

// Convert error type to string
const char* error_type_to_string(error_type type);

// Base exception, carries an error_type code
class error : public std::runtime_error {
public:
    error(error_type type, const std::string& message)
        : std::runtime_error(message), type_(type) {}

    error_type type() const { return type_; }

private:
    error_type type_;
};

class connection_error : public error {
public:
    explicit connection_error(const std::string& message)
        : error(ERROR_TYPE_CONNECTION, message) {}
};

class channel_error : public error {
public:
    explicit channel_error(const std::string& message)
        : error(ERROR_TYPE_CHANNEL, message) {}
};

class max_reconnect_error : public error {
public:
    explicit max_reconnect_error(const std::string& message)
        : error(ERROR_TYPE_MAX_RECONNECT, message) {}
};

class validation_error : public error {
public:
    explicit validation_error(const std::string& message)
        : error(ERROR_TYPE_VALIDATION, message) {}
};

// Voting API misuse: unknown session, closed session, deadline passed
class session_error : public error {
public:
    session_error(error_type type, const std::string& message)
        : error(type, message) {}
};

// Failure policy configuration
struct failure_policy {
    int max_retries;             // Redeliveries before dead-lettering
    int64_t retry_delay_ms;      // Initial reconnect delay
    float backoff_multiplier;    // Exponential backoff factor
    int64_t max_retry_delay_ms;  // Reconnect delay cap
    int max_reconnect_attempts;  // Reconnects before the fatal signal

    // max_retries = 3, delays 1000 * 2^n capped at 30000, 10 reconnects
    static failure_policy default_policy();

    // Delay before reconnect attempt `attempt` (0-based)
    int64_t backoff_delay_ms(int attempt) const;
};

// One failed processing attempt of a message
struct failure_record {
    std::string message_id;      // Original message id
    std::string agent_id;        // Agent that failed
    error_type error;            // Error classification
    std::string error_message;   // Error details
    int64_t timestamp;           // Failure timestamp (ms)
    int attempt;                 // 1-based delivery attempt

    // Serialize to JSON
    std::string to_json() const;

    // Deserialize from JSON
    static failure_record from_json(const std::string& json_str);
};

// Dead letter store for messages that exhausted retries or were malformed
class dead_letter_queue {
public:
    dead_letter_queue(size_t max_size = 1000);
    ~dead_letter_queue();

    struct dead_letter {
        std::string message_id;
        std::string payload;
        error_type error;                     // Triggering error
        std::string error_message;
        int64_t queued_at;
        std::vector<failure_record> history;  // Every failed attempt, oldest first
    };

    // Add failed message (replaces an earlier letter with the same id)
    void add_message(const std::string& message_id,
                    const std::string& payload,
                    const failure_record& failure,
                    const std::vector<failure_record>& history);

    // Lookup by original message id
    std::optional<dead_letter> get_message(const std::string& message_id) const;

    // Oldest first
    std::vector<dead_letter> get_messages(int limit = 100) const;

    bool contains(const std::string& message_id) const;

    // Remove message from queue
    bool remove_message(const std::string& message_id);

    size_t size() const;

    void clear();

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace hive
