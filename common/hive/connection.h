#pragma once

#include "transport.h"
#include "failure.h"
#include <string>
#include <memory>
#include <functional>

namespace hive {

// Connection lifecycle observer. Listeners fire synchronously, in
// registration order, on the thread that caused the transition.
class connection_listener {
public:
    virtual ~connection_listener() = default;

    virtual void on_connected() {}
    virtual void on_disconnected(const std::string& reason) { (void) reason; }
    virtual void on_error(const error& err) { (void) err; }

    // Reconnect budget exhausted, no further automatic attempts
    virtual void on_max_reconnect(int attempts) { (void) attempts; }
};

// Owns the broker connection/channel and the reconnect loop
class connection_manager {
public:
    using sleep_function = std::function<void(int64_t delay_ms)>;

    connection_manager(channel_factory factory,
                       const broker_config& config,
                       const failure_policy& policy = failure_policy::default_policy(),
                       bool auto_reconnect = true);
    ~connection_manager();

    connection_manager(const connection_manager&) = delete;
    connection_manager& operator=(const connection_manager&) = delete;

    // Open connection + channel and apply prefetch, throws connection_error
    void connect();

    // Close channel then connection; safe to call repeatedly
    void close();

    // True iff connection and channel are live
    bool is_healthy() const;

    // Current channel, throws channel_error when not connected
    std::shared_ptr<broker_channel> channel() const;

    // Run `op` on the channel. A channel_error triggers the reconnect loop and
    // one more try; throws max_reconnect_error once the budget is spent.
    void with_channel(const std::function<void(broker_channel&)>& op);

    // Report an unexpected channel close. Returns true when a live channel is
    // available afterwards.
    bool on_channel_lost(const std::string& reason);

    // Backoff loop: up to max_reconnect_attempts tries, sleeping
    // backoff_delay_ms(n) before try n
    bool reconnect();

    // Listeners are not owned and must outlive their registration
    void add_listener(connection_listener* listener);
    void remove_listener(connection_listener* listener);

    void set_sleep_function(sleep_function fn);
    void set_auto_reconnect(bool enabled);
    bool auto_reconnect() const;

    // Failed attempts since the last successful connect
    int reconnect_attempts() const;
    bool reconnect_exhausted() const;

    const broker_config& config() const;
    const failure_policy& policy() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace hive
