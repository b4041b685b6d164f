#include "failure.h"
#include "message.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <deque>
#include <mutex>

using json = nlohmann::json;

namespace hive {

// Convert error type to string
const char* error_type_to_string(error_type type) {
    switch (type) {
        case ERROR_TYPE_NONE: return "none";
        case ERROR_TYPE_CONNECTION: return "connection";
        case ERROR_TYPE_CHANNEL: return "channel";
        case ERROR_TYPE_MAX_RECONNECT: return "max_reconnect";
        case ERROR_TYPE_VALIDATION: return "validation";
        case ERROR_TYPE_SESSION_NOT_FOUND: return "session_not_found";
        case ERROR_TYPE_SESSION_CLOSED: return "session_closed";
        case ERROR_TYPE_HANDLER: return "handler";
        case ERROR_TYPE_RETRY_EXHAUSTED: return "retry_exhausted";
        case ERROR_TYPE_UNKNOWN: return "unknown";
        default: return "unknown";
    }
}

static error_type error_type_from_string(const std::string& str) {
    if (str == "none") return ERROR_TYPE_NONE;
    if (str == "connection") return ERROR_TYPE_CONNECTION;
    if (str == "channel") return ERROR_TYPE_CHANNEL;
    if (str == "max_reconnect") return ERROR_TYPE_MAX_RECONNECT;
    if (str == "validation") return ERROR_TYPE_VALIDATION;
    if (str == "session_not_found") return ERROR_TYPE_SESSION_NOT_FOUND;
    if (str == "session_closed") return ERROR_TYPE_SESSION_CLOSED;
    if (str == "handler") return ERROR_TYPE_HANDLER;
    if (str == "retry_exhausted") return ERROR_TYPE_RETRY_EXHAUSTED;
    return ERROR_TYPE_UNKNOWN;
}

// failure_policy implementation
failure_policy failure_policy::default_policy() {
    failure_policy p;
    p.max_retries = 3;
    p.retry_delay_ms = 1000;
    p.backoff_multiplier = 2.0f;
    p.max_retry_delay_ms = 30000;
    p.max_reconnect_attempts = 10;
    return p;
}

int64_t failure_policy::backoff_delay_ms(int attempt) const {
    double delay = static_cast<double>(retry_delay_ms);
    for (int i = 0; i < attempt; i++) {
        delay *= backoff_multiplier;
        if (delay >= static_cast<double>(max_retry_delay_ms)) {
            return max_retry_delay_ms;
        }
    }
    return std::min(static_cast<int64_t>(delay), max_retry_delay_ms);
}

// failure_record implementation
std::string failure_record::to_json() const {
    json j;
    j["message_id"] = message_id;
    j["agent_id"] = agent_id;
    j["error"] = error_type_to_string(error);
    j["error_message"] = error_message;
    j["timestamp"] = timestamp;
    j["attempt"] = attempt;
    return j.dump();
}

failure_record failure_record::from_json(const std::string& json_str) {
    json j = json::parse(json_str);
    failure_record record;
    record.message_id = j.value("message_id", "");
    record.agent_id = j.value("agent_id", "");
    record.error = error_type_from_string(j.value("error", "unknown"));
    record.error_message = j.value("error_message", "");
    record.timestamp = j.value("timestamp", get_timestamp_ms());
    record.attempt = j.value("attempt", 0);
    return record;
}

// dead_letter_queue implementation
struct dead_letter_queue::impl {
    std::deque<dead_letter> queue;
    size_t max_size;
    mutable std::mutex mutex;

    impl(size_t max) : max_size(max) {}

    std::deque<dead_letter>::iterator find(const std::string& message_id) {
        return std::find_if(queue.begin(), queue.end(),
            [&message_id](const dead_letter& letter) {
                return letter.message_id == message_id;
            });
    }
};

dead_letter_queue::dead_letter_queue(size_t max_size)
    : pimpl(std::make_unique<impl>(max_size)) {}

dead_letter_queue::~dead_letter_queue() = default;

void dead_letter_queue::add_message(
    const std::string& message_id,
    const std::string& payload,
    const failure_record& failure,
    const std::vector<failure_record>& history) {

    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->find(message_id);
    if (it != pimpl->queue.end()) {
        pimpl->queue.erase(it);
    }

    dead_letter letter;
    letter.message_id = message_id;
    letter.payload = payload;
    letter.error = failure.error;
    letter.error_message = failure.error_message;
    letter.queued_at = get_timestamp_ms();
    letter.history = history;

    pimpl->queue.push_back(std::move(letter));

    // Enforce max size
    while (pimpl->queue.size() > pimpl->max_size) {
        pimpl->queue.pop_front();
    }
}

std::optional<dead_letter_queue::dead_letter> dead_letter_queue::get_message(
    const std::string& message_id) const {

    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->find(message_id);
    if (it == pimpl->queue.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<dead_letter_queue::dead_letter> dead_letter_queue::get_messages(int limit) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    std::vector<dead_letter> messages;
    int count = 0;

    for (const auto& letter : pimpl->queue) {
        if (limit > 0 && count >= limit) break;
        messages.push_back(letter);
        count++;
    }

    return messages;
}

bool dead_letter_queue::contains(const std::string& message_id) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->find(message_id) != pimpl->queue.end();
}

bool dead_letter_queue::remove_message(const std::string& message_id) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);

    auto it = pimpl->find(message_id);
    if (it != pimpl->queue.end()) {
        pimpl->queue.erase(it);
        return true;
    }

    return false;
}

size_t dead_letter_queue::size() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->queue.size();
}

void dead_letter_queue::clear() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->queue.clear();
}

} // namespace hive
