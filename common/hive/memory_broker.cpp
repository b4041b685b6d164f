#include "memory_broker.h"
#include "failure.h"
#include "message.h"
#include "log.h"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>

namespace hive {

struct memory_broker::impl {
    struct stored_message {
        outbound_message message;
        std::string exchange;
        std::string routing_key;
        int64_t enqueued_at;
        bool redelivered;
    };

    struct queue_state {
        queue_options options;
        std::deque<stored_message> ready;
        int owner = 0;            // channel owning an exclusive queue
        int consumers = 0;
    };

    struct exchange_state {
        exchange_kind kind;
        bool durable;
        std::vector<std::pair<std::string, std::string>> bindings;  // queue, key
    };

    struct consumer_state {
        std::string queue;
        int channel;
    };

    struct unacked_message {
        std::string queue;
        stored_message stored;
    };

    struct channel_state {
        bool open = true;
        int prefetch = 0;
        uint64_t next_delivery_tag = 1;
        std::vector<std::string> consumer_tags;
        std::map<uint64_t, unacked_message> unacked;
    };

    std::map<std::string, queue_state> queues;
    std::map<std::string, exchange_state> exchanges;
    std::map<std::string, consumer_state> consumers;
    std::map<int, channel_state> channels;

    mutable std::mutex mutex;
    std::condition_variable cv;

    bool reachable = true;
    int next_channel_id = 1;
    uint64_t next_consumer_id = 1;
    int64_t published = 0;
    int64_t dropped = 0;

    channel_state& live_channel(int id) {
        auto it = channels.find(id);
        if (it == channels.end() || !it->second.open) {
            throw channel_error("channel " + std::to_string(id) + " is closed");
        }
        return it->second;
    }

    void enqueue(queue_state& q, stored_message msg) {
        if (q.options.max_length > 0) {
            while (static_cast<int64_t>(q.ready.size()) >= q.options.max_length) {
                q.ready.pop_front();
                dropped++;
            }
        }
        q.ready.push_back(std::move(msg));
    }

    void drop_expired(queue_state& q, int64_t now) {
        if (q.options.message_ttl_ms <= 0) {
            return;
        }
        while (!q.ready.empty() && now - q.ready.front().enqueued_at >= q.options.message_ttl_ms) {
            q.ready.pop_front();
            dropped++;
        }
    }

    void requeue(const std::string& queue, stored_message msg) {
        auto it = queues.find(queue);
        if (it == queues.end()) {
            dropped++;
            return;
        }
        msg.redelivered = true;
        it->second.ready.push_front(std::move(msg));
    }

    void remove_consumer(const std::string& tag) {
        auto it = consumers.find(tag);
        if (it == consumers.end()) {
            return;
        }
        auto q = queues.find(it->second.queue);
        if (q != queues.end()) {
            q->second.consumers--;
            if (q->second.options.auto_delete && q->second.consumers <= 0) {
                delete_queue(it->second.queue);
            }
        }
        consumers.erase(it);
    }

    void delete_queue(const std::string& name) {
        queues.erase(name);
        for (auto& [ex_name, ex] : exchanges) {
            ex.bindings.erase(std::remove_if(ex.bindings.begin(), ex.bindings.end(),
                [&name](const std::pair<std::string, std::string>& b) { return b.first == name; }),
                ex.bindings.end());
        }
    }

    void close_channel(int id) {
        auto it = channels.find(id);
        if (it == channels.end() || !it->second.open) {
            return;
        }
        auto& ch = it->second;
        ch.open = false;

        // unacked deliveries go back to their queues, oldest first
        for (auto rit = ch.unacked.rbegin(); rit != ch.unacked.rend(); ++rit) {
            requeue(rit->second.queue, rit->second.stored);
        }
        ch.unacked.clear();

        for (const auto& tag : ch.consumer_tags) {
            remove_consumer(tag);
        }
        ch.consumer_tags.clear();

        std::vector<std::string> exclusive;
        for (const auto& [name, q] : queues) {
            if (q.options.exclusive && q.owner == id) {
                exclusive.push_back(name);
            }
        }
        for (const auto& name : exclusive) {
            delete_queue(name);
        }

        cv.notify_all();
    }
};

// A channel on the in-process broker
class memory_channel : public broker_channel {
public:
    memory_channel(std::shared_ptr<memory_broker::impl> broker, int id)
        : broker_(std::move(broker)), id_(id) {}

    ~memory_channel() override {
        close();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        auto it = broker_->channels.find(id_);
        return it != broker_->channels.end() && it->second.open;
    }

    void set_prefetch(int count) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        broker_->live_channel(id_).prefetch = count;
    }

    void declare_queue(const std::string& name, const queue_options& options) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        broker_->live_channel(id_);

        auto it = broker_->queues.find(name);
        if (it != broker_->queues.end()) {
            if (it->second.options != options) {
                throw channel_error("PRECONDITION_FAILED - inequivalent arguments for queue '" + name + "'");
            }
            if (options.exclusive && it->second.owner != id_) {
                throw channel_error("RESOURCE_LOCKED - queue '" + name + "' is exclusive to another connection");
            }
            return;
        }

        memory_broker::impl::queue_state q;
        q.options = options;
        q.owner = options.exclusive ? id_ : 0;
        broker_->queues.emplace(name, std::move(q));
    }

    void declare_exchange(const std::string& name, exchange_kind kind, bool durable) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        broker_->live_channel(id_);

        auto it = broker_->exchanges.find(name);
        if (it != broker_->exchanges.end()) {
            if (it->second.kind != kind || it->second.durable != durable) {
                throw channel_error("PRECONDITION_FAILED - inequivalent arguments for exchange '" + name + "'");
            }
            return;
        }
        broker_->exchanges.emplace(name, memory_broker::impl::exchange_state{kind, durable, {}});
    }

    void bind_queue(const std::string& queue, const std::string& exchange,
                    const std::string& routing_key) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        broker_->live_channel(id_);

        if (broker_->queues.find(queue) == broker_->queues.end()) {
            throw channel_error("NOT_FOUND - no queue '" + queue + "'");
        }
        auto ex = broker_->exchanges.find(exchange);
        if (ex == broker_->exchanges.end()) {
            throw channel_error("NOT_FOUND - no exchange '" + exchange + "'");
        }
        auto binding = std::make_pair(queue, routing_key);
        auto& bindings = ex->second.bindings;
        if (std::find(bindings.begin(), bindings.end(), binding) == bindings.end()) {
            bindings.push_back(binding);
        }
    }

    void publish(const std::string& exchange, const std::string& routing_key,
                 const outbound_message& message) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        broker_->live_channel(id_);

        std::vector<std::string> targets;
        if (exchange.empty()) {
            targets.push_back(routing_key);
        } else {
            auto ex = broker_->exchanges.find(exchange);
            if (ex == broker_->exchanges.end()) {
                throw channel_error("NOT_FOUND - no exchange '" + exchange + "'");
            }
            for (const auto& [queue, key] : ex->second.bindings) {
                bool match = false;
                switch (ex->second.kind) {
                    case EXCHANGE_KIND_FANOUT: match = true; break;
                    case EXCHANGE_KIND_DIRECT: match = key == routing_key; break;
                    case EXCHANGE_KIND_TOPIC:  match = topic_matches(key, routing_key); break;
                }
                if (match && std::find(targets.begin(), targets.end(), queue) == targets.end()) {
                    targets.push_back(queue);
                }
            }
        }

        broker_->published++;
        const int64_t now = get_timestamp_ms();
        for (const auto& name : targets) {
            auto q = broker_->queues.find(name);
            if (q == broker_->queues.end()) {
                continue;   // unroutable
            }
            broker_->enqueue(q->second, {message, exchange, routing_key, now, false});
        }
        broker_->cv.notify_all();
    }

    std::string consume(const std::string& queue, bool exclusive) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        auto& ch = broker_->live_channel(id_);

        auto q = broker_->queues.find(queue);
        if (q == broker_->queues.end()) {
            throw channel_error("NOT_FOUND - no queue '" + queue + "'");
        }
        if (exclusive && q->second.consumers > 0) {
            throw channel_error("ACCESS_REFUSED - queue '" + queue + "' already has consumers");
        }

        std::string tag = "ctag-" + std::to_string(id_) + "." + std::to_string(broker_->next_consumer_id++);
        broker_->consumers[tag] = {queue, id_};
        q->second.consumers++;
        ch.consumer_tags.push_back(tag);
        return tag;
    }

    void cancel(const std::string& consumer_tag) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        auto& ch = broker_->live_channel(id_);
        ch.consumer_tags.erase(std::remove(ch.consumer_tags.begin(), ch.consumer_tags.end(), consumer_tag),
                               ch.consumer_tags.end());
        broker_->remove_consumer(consumer_tag);
    }

    bool next_delivery(delivery& out, int timeout_ms) override {
        std::unique_lock<std::mutex> lock(broker_->mutex);
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));

        while (true) {
            auto& ch = broker_->live_channel(id_);

            const bool window_full = ch.prefetch > 0 &&
                static_cast<int>(ch.unacked.size()) >= ch.prefetch;

            if (!window_full && take(ch, out)) {
                return true;
            }

            if (broker_->cv.wait_until(lock, deadline) == std::cv_status::timeout) {
                auto& again = broker_->live_channel(id_);
                const bool full = again.prefetch > 0 &&
                    static_cast<int>(again.unacked.size()) >= again.prefetch;
                return !full && take(again, out);
            }
        }
    }

    void ack(const delivery& d) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        auto& ch = broker_->live_channel(id_);
        if (ch.unacked.erase(d.delivery_tag) == 0) {
            throw channel_error("PRECONDITION_FAILED - unknown delivery tag " + std::to_string(d.delivery_tag));
        }
        broker_->cv.notify_all();
    }

    void nack(const delivery& d, bool requeue) override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        auto& ch = broker_->live_channel(id_);
        auto it = ch.unacked.find(d.delivery_tag);
        if (it == ch.unacked.end()) {
            throw channel_error("PRECONDITION_FAILED - unknown delivery tag " + std::to_string(d.delivery_tag));
        }
        if (requeue) {
            broker_->requeue(it->second.queue, it->second.stored);
        } else {
            broker_->dropped++;
        }
        ch.unacked.erase(it);
        broker_->cv.notify_all();
    }

    void reject(const delivery& d) override {
        nack(d, false);
    }

    void close() override {
        std::lock_guard<std::mutex> lock(broker_->mutex);
        broker_->close_channel(id_);
    }

private:
    bool take(memory_broker::impl::channel_state& ch, delivery& out) {
        const int64_t now = get_timestamp_ms();
        for (const auto& tag : ch.consumer_tags) {
            auto c = broker_->consumers.find(tag);
            if (c == broker_->consumers.end()) {
                continue;
            }
            auto q = broker_->queues.find(c->second.queue);
            if (q == broker_->queues.end()) {
                continue;
            }
            broker_->drop_expired(q->second, now);
            if (q->second.ready.empty()) {
                continue;
            }

            auto stored = std::move(q->second.ready.front());
            q->second.ready.pop_front();

            out.consumer_tag = tag;
            out.delivery_tag = ch.next_delivery_tag++;
            out.exchange = stored.exchange;
            out.routing_key = stored.routing_key;
            out.message_id = stored.message.message_id;
            out.content_type = stored.message.content_type;
            out.body = stored.message.body;
            out.headers = stored.message.headers;
            out.redelivered = stored.redelivered;

            ch.unacked[out.delivery_tag] = {c->second.queue, std::move(stored)};
            return true;
        }
        return false;
    }

    std::shared_ptr<memory_broker::impl> broker_;
    int id_;
};

memory_broker::memory_broker() : pimpl(std::make_shared<impl>()) {}

memory_broker::~memory_broker() {
    sever_connections();
}

std::unique_ptr<broker_channel> memory_broker::open(const broker_config& config) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    if (!pimpl->reachable) {
        throw connection_error("broker unreachable: " + config.url);
    }
    const int id = pimpl->next_channel_id++;
    pimpl->channels[id] = impl::channel_state{};
    LOG_DBG("memory broker: channel %d opened\n", id);
    return std::make_unique<memory_channel>(pimpl, id);
}

channel_factory memory_broker::factory() {
    std::weak_ptr<impl> weak = pimpl;
    return [this, weak](const broker_config& config) -> std::unique_ptr<broker_channel> {
        if (weak.expired()) {
            throw connection_error("broker unreachable: " + config.url);
        }
        return open(config);
    };
}

void memory_broker::set_reachable(bool reachable) {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    pimpl->reachable = reachable;
}

void memory_broker::sever_connections() {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    for (auto& [id, ch] : pimpl->channels) {
        if (ch.open) {
            pimpl->close_channel(id);
        }
    }
}

bool memory_broker::has_queue(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->queues.find(name) != pimpl->queues.end();
}

bool memory_broker::has_exchange(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->exchanges.find(name) != pimpl->exchanges.end();
}

size_t memory_broker::queue_depth(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    auto it = pimpl->queues.find(name);
    return it == pimpl->queues.end() ? 0 : it->second.ready.size();
}

size_t memory_broker::unacked_count() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    size_t count = 0;
    for (const auto& [id, ch] : pimpl->channels) {
        count += ch.unacked.size();
    }
    return count;
}

int memory_broker::open_channel_count() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    int count = 0;
    for (const auto& [id, ch] : pimpl->channels) {
        if (ch.open) count++;
    }
    return count;
}

int64_t memory_broker::published_count() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->published;
}

int64_t memory_broker::dropped_count() const {
    std::lock_guard<std::mutex> lock(pimpl->mutex);
    return pimpl->dropped;
}

} // namespace hive
