#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <map>
#include <functional>

namespace hive {

enum exchange_kind {
    EXCHANGE_KIND_DIRECT,
    EXCHANGE_KIND_FANOUT,
    EXCHANGE_KIND_TOPIC
};

const char* exchange_kind_to_string(exchange_kind kind);

// Queue declaration properties. Re-declaring with equal options is a no-op,
// re-declaring with different options fails with channel_error.
struct queue_options {
    bool durable = false;
    bool exclusive = false;
    bool auto_delete = false;
    int64_t message_ttl_ms = 0;  // 0 = no TTL
    int64_t max_length = 0;      // 0 = unbounded

    bool operator==(const queue_options& other) const {
        return durable == other.durable && exclusive == other.exclusive &&
               auto_delete == other.auto_delete && message_ttl_ms == other.message_ttl_ms &&
               max_length == other.max_length;
    }
    bool operator!=(const queue_options& other) const { return !(*this == other); }
};

struct outbound_message {
    std::string body;
    std::string content_type = "application/json";
    std::string message_id;
    bool persistent = false;
    std::map<std::string, std::string> headers;
};

struct delivery {
    std::string consumer_tag;
    uint64_t delivery_tag = 0;
    std::string exchange;
    std::string routing_key;
    std::string message_id;
    std::string content_type;
    std::string body;
    std::map<std::string, std::string> headers;
    bool redelivered = false;
};

// Connection settings for a broker channel
struct broker_config {
    std::string url = "amqp://localhost:5672";
    int heartbeat_s = 30;
    int prefetch_count = 1;
};

// One open connection + channel to a broker. Transport failures surface as
// channel_error (lost while open) or connection_error (could not open).
class broker_channel {
public:
    virtual ~broker_channel() = default;

    virtual bool is_open() const = 0;

    // Bound on unacknowledged deliveries for consumers started afterwards
    virtual void set_prefetch(int count) = 0;

    virtual void declare_queue(const std::string& name, const queue_options& options) = 0;
    virtual void declare_exchange(const std::string& name, exchange_kind kind, bool durable) = 0;
    virtual void bind_queue(const std::string& queue, const std::string& exchange,
                            const std::string& routing_key) = 0;

    // Empty exchange publishes straight to the queue named by routing_key
    virtual void publish(const std::string& exchange, const std::string& routing_key,
                         const outbound_message& message) = 0;

    // Start consuming, returns the consumer tag
    virtual std::string consume(const std::string& queue, bool exclusive) = 0;
    virtual void cancel(const std::string& consumer_tag) = 0;

    // Wait up to timeout_ms for the next delivery on any consumer of this channel
    virtual bool next_delivery(delivery& out, int timeout_ms) = 0;

    virtual void ack(const delivery& d) = 0;
    virtual void nack(const delivery& d, bool requeue) = 0;
    virtual void reject(const delivery& d) = 0;

    virtual void close() = 0;
};

// Opens a channel, throws connection_error when the broker is unreachable
using channel_factory = std::function<std::unique_ptr<broker_channel>(const broker_config&)>;

// AMQP topic match: words separated by '.', '*' matches one word, '#' zero or more
bool topic_matches(const std::string& pattern, const std::string& routing_key);

} // namespace hive
