#include "connection.h"
#include "log.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace hive {

struct connection_manager::impl {
    channel_factory factory;
    broker_config config;
    failure_policy policy;
    std::atomic<bool> auto_reconnect;

    std::shared_ptr<broker_channel> channel;
    mutable std::mutex mutex;

    // serializes reconnect loops
    std::mutex reconnect_mutex;

    std::vector<connection_listener*> listeners;
    std::mutex listeners_mutex;

    sleep_function sleep;

    int attempts = 0;
    bool exhausted = false;
    bool closed = true;

    impl(channel_factory f, const broker_config& cfg, const failure_policy& p, bool reconnect)
        : factory(std::move(f)), config(cfg), policy(p), auto_reconnect(reconnect) {
        sleep = [](int64_t delay_ms) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        };
    }

    std::vector<connection_listener*> snapshot_listeners() {
        std::lock_guard<std::mutex> lock(listeners_mutex);
        return listeners;
    }

    void fire_connected() {
        for (auto* l : snapshot_listeners()) l->on_connected();
    }

    void fire_disconnected(const std::string& reason) {
        for (auto* l : snapshot_listeners()) l->on_disconnected(reason);
    }

    void fire_error(const error& err) {
        for (auto* l : snapshot_listeners()) l->on_error(err);
    }

    void fire_max_reconnect(int count) {
        for (auto* l : snapshot_listeners()) l->on_max_reconnect(count);
    }

    // Opens a channel and installs it; throws connection_error / channel_error
    void open_channel() {
        std::unique_ptr<broker_channel> ch = factory(config);
        if (!ch || !ch->is_open()) {
            throw connection_error("broker refused connection: " + config.url);
        }
        ch->set_prefetch(config.prefetch_count);

        std::lock_guard<std::mutex> lock(mutex);
        channel = std::move(ch);
        closed = false;
        attempts = 0;
        exhausted = false;
    }

    void drop_channel() {
        std::shared_ptr<broker_channel> old;
        {
            std::lock_guard<std::mutex> lock(mutex);
            old = std::move(channel);
        }
        if (old) {
            try {
                old->close();
            } catch (const std::exception & e) {
                LOG_DBG("connection: close of lost channel failed: %s\n", e.what());
            }
        }
    }
};

connection_manager::connection_manager(channel_factory factory,
                                       const broker_config& config,
                                       const failure_policy& policy,
                                       bool auto_reconnect)
    : pimpl(std::make_unique<impl>(std::move(factory), config, policy, auto_reconnect)) {}

connection_manager::~connection_manager() {
    close();
}

void connection_manager::connect() {
    LOG_INF("connection: connecting to %s (heartbeat %ds, prefetch %d)\n",
            pimpl->config.url.c_str(), pimpl->config.heartbeat_s, pimpl->config.prefetch_count);
    try {
        pimpl->open_channel();
    } catch (const error & e) {
        LOG_ERR("connection: failed to connect: %s\n", e.what());
        pimpl->fire_error(e);
        throw connection_error(std::string("failed to connect: ") + e.what());
    }
    LOG_INF("connection: connected\n");
    pimpl->fire_connected();
}

void connection_manager::close() {
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        if (pimpl->closed && !pimpl->channel) {
            return;
        }
        pimpl->closed = true;
    }
    pimpl->drop_channel();
    LOG_INF("connection: closed\n");
    pimpl->fire_disconnected("closed by client");
}

bool connection_manager::is_healthy() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->channel && pimpl->channel->is_open();
}

std::shared_ptr<broker_channel> connection_manager::channel() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    if (!pimpl->channel || !pimpl->channel->is_open()) {
        throw channel_error("not connected");
    }
    return pimpl->channel;
}

void connection_manager::with_channel(const std::function<void(broker_channel&)>& op) {
    for (int pass = 0; pass < 2; pass++) {
        std::shared_ptr<broker_channel> ch;
        try {
            ch = channel();
            op(*ch);
            return;
        } catch (const channel_error & e) {
            if (pass == 1 || !on_channel_lost(e.what())) {
                if (reconnect_exhausted()) {
                    throw max_reconnect_error("broker unavailable after " +
                                              std::to_string(pimpl->policy.max_reconnect_attempts) +
                                              " reconnect attempts");
                }
                throw;
            }
        }
    }
}

bool connection_manager::on_channel_lost(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        if (pimpl->closed) {
            return false;
        }
    }

    LOG_WRN("connection: channel lost: %s\n", reason.c_str());
    pimpl->fire_error(channel_error(reason));

    if (!pimpl->auto_reconnect) {
        pimpl->drop_channel();
        pimpl->fire_disconnected(reason);
        return false;
    }
    return reconnect();
}

bool connection_manager::reconnect() {
    std::lock_guard<std::mutex> guard(pimpl->reconnect_mutex);

    // another thread may have finished a reconnect while we waited
    if (is_healthy()) {
        return true;
    }

    pimpl->drop_channel();
    pimpl->fire_disconnected("reconnecting");

    while (true) {
        int attempt;
        {
            std::lock_guard<std::mutex> lock(pimpl->mutex);
            if (pimpl->closed) {
                return false;
            }
            if (pimpl->attempts >= pimpl->policy.max_reconnect_attempts) {
                pimpl->exhausted = true;
            }
            attempt = pimpl->attempts;
        }

        if (reconnect_exhausted()) {
            LOG_ERR("connection: max reconnect attempts (%d) reached, giving up\n", attempt);
            pimpl->fire_max_reconnect(attempt);
            return false;
        }

        const int64_t delay = pimpl->policy.backoff_delay_ms(attempt);
        {
            std::lock_guard<std::mutex> lock(pimpl->mutex);
            pimpl->attempts++;
        }
        LOG_WRN("connection: reconnect attempt %d/%d in %lld ms\n",
                attempt + 1, pimpl->policy.max_reconnect_attempts, (long long) delay);
        pimpl->sleep(delay);

        try {
            pimpl->open_channel();
        } catch (const error & e) {
            LOG_WRN("connection: reconnect attempt %d failed: %s\n", attempt + 1, e.what());
            pimpl->fire_error(e);
            continue;
        }

        LOG_INF("connection: reconnected after %d attempt(s)\n", attempt + 1);
        pimpl->fire_connected();
        return true;
    }
}

void connection_manager::add_listener(connection_listener* listener) {
    std::lock_guard<std::mutex> lock(pimpl->listeners_mutex);
    pimpl->listeners.push_back(listener);
}

void connection_manager::remove_listener(connection_listener* listener) {
    std::lock_guard<std::mutex> lock(pimpl->listeners_mutex);
    auto& v = pimpl->listeners;
    v.erase(std::remove(v.begin(), v.end(), listener), v.end());
}

void connection_manager::set_sleep_function(sleep_function fn) {
    pimpl->sleep = std::move(fn);
}

void connection_manager::set_auto_reconnect(bool enabled) {
    pimpl->auto_reconnect = enabled;
}

bool connection_manager::auto_reconnect() const {
    return pimpl->auto_reconnect;
}

int connection_manager::reconnect_attempts() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->attempts;
}

bool connection_manager::reconnect_exhausted() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->exhausted;
}

const broker_config& connection_manager::config() const {
    return pimpl->config;
}

const failure_policy& connection_manager::policy() const {
    return pimpl->policy;
}

} // namespace hive
