#pragma once

#include "transport.h"
#include <string>
#include <memory>
#include <cstdint>

namespace hive {

class memory_channel;

// In-process broker implementing AMQP 0-9-1 queue/exchange semantics for the
// subset hive uses. Backs the tests and single-process demos.
class memory_broker {
public:
    memory_broker();
    ~memory_broker();

    memory_broker(const memory_broker&) = delete;
    memory_broker& operator=(const memory_broker&) = delete;

    // Open a new connection + channel, throws connection_error when unreachable
    std::unique_ptr<broker_channel> open(const broker_config& config);

    // Channel factory bound to this broker
    channel_factory factory();

    // When false, open() fails as if the broker were down
    void set_reachable(bool reachable);

    // Drop every open channel; unacked deliveries are requeued as redelivered
    void sever_connections();

    // Inspection
    bool has_queue(const std::string& name) const;
    bool has_exchange(const std::string& name) const;
    size_t queue_depth(const std::string& name) const;
    size_t unacked_count() const;
    int open_channel_count() const;
    int64_t published_count() const;
    int64_t dropped_count() const;   // rejected, nacked without requeue, expired or overflowed

private:
    friend class memory_channel;

    struct impl;
    std::shared_ptr<impl> pimpl;
};

} // namespace hive
