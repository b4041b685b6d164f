#include "amqp_channel.h"
#include "failure.h"
#include "log.h"

#include <SimpleAmqpClient/SimpleAmqpClient.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace hive {

// SimpleAmqpClient channels are not thread-safe; every call is serialized
class amqp_channel : public broker_channel {
public:
    amqp_channel(AmqpClient::Channel::ptr_t channel, const broker_config& config)
        : channel_(std::move(channel)), prefetch_(config.prefetch_count),
          poll_slice_ms_(std::max(1, std::min(config.heartbeat_s * 1000, 100))) {}

    ~amqp_channel() override {
        close();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    void set_prefetch(int count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        prefetch_ = count;
    }

    void declare_queue(const std::string& name, const queue_options& options) override {
        AmqpClient::Table args;
        if (options.message_ttl_ms > 0) {
            args.insert(AmqpClient::TableEntry("x-message-ttl",
                AmqpClient::TableValue(static_cast<int32_t>(options.message_ttl_ms))));
        }
        if (options.max_length > 0) {
            args.insert(AmqpClient::TableEntry("x-max-length",
                AmqpClient::TableValue(static_cast<int32_t>(options.max_length))));
        }
        guarded("declare queue " + name, [&]() {
            channel_->DeclareQueue(name, false, options.durable, options.exclusive, options.auto_delete, args);
        });
    }

    void declare_exchange(const std::string& name, exchange_kind kind, bool durable) override {
        const char* type = AmqpClient::Channel::EXCHANGE_TYPE_DIRECT;
        switch (kind) {
            case EXCHANGE_KIND_DIRECT: type = AmqpClient::Channel::EXCHANGE_TYPE_DIRECT; break;
            case EXCHANGE_KIND_FANOUT: type = AmqpClient::Channel::EXCHANGE_TYPE_FANOUT; break;
            case EXCHANGE_KIND_TOPIC:  type = AmqpClient::Channel::EXCHANGE_TYPE_TOPIC;  break;
        }
        guarded("declare exchange " + name, [&]() {
            channel_->DeclareExchange(name, type, false, durable, false);
        });
    }

    void bind_queue(const std::string& queue, const std::string& exchange,
                    const std::string& routing_key) override {
        guarded("bind " + queue, [&]() {
            channel_->BindQueue(queue, exchange, routing_key);
        });
    }

    void publish(const std::string& exchange, const std::string& routing_key,
                 const outbound_message& message) override {
        auto msg = AmqpClient::BasicMessage::Create(message.body);
        msg->ContentType(message.content_type);
        if (!message.message_id.empty()) {
            msg->MessageId(message.message_id);
        }
        if (message.persistent) {
            msg->DeliveryMode(AmqpClient::BasicMessage::dm_persistent);
        }
        if (!message.headers.empty()) {
            AmqpClient::Table headers;
            for (const auto& [key, value] : message.headers) {
                headers.insert(AmqpClient::TableEntry(key, AmqpClient::TableValue(value)));
            }
            msg->HeaderTable(headers);
        }
        guarded("publish to " + (exchange.empty() ? routing_key : exchange), [&]() {
            channel_->BasicPublish(exchange, routing_key, msg, false, false);
        });
    }

    std::string consume(const std::string& queue, bool exclusive) override {
        std::string tag;
        guarded("consume " + queue, [&]() {
            tag = channel_->BasicConsume(queue, "", true, false, exclusive, static_cast<uint16_t>(prefetch_));
            tags_.push_back(tag);
        });
        return tag;
    }

    void cancel(const std::string& consumer_tag) override {
        guarded("cancel " + consumer_tag, [&]() {
            channel_->BasicCancel(consumer_tag);
            tags_.erase(std::remove(tags_.begin(), tags_.end(), consumer_tag), tags_.end());
        });
    }

    bool next_delivery(delivery& out, int timeout_ms) override {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));

        // short slices so publishers on other threads are not starved
        do {
            AmqpClient::Envelope::ptr_t env;
            bool received = false;
            bool idle = false;
            guarded("consume message", [&]() {
                if (tags_.empty()) {
                    idle = true;
                    return;
                }
                received = channel_->BasicConsumeMessage(tags_, env, poll_slice_ms_);
            });

            if (received && env) {
                std::lock_guard<std::mutex> lock(mutex_);
                auto message = env->Message();
                out.consumer_tag = env->ConsumerTag();
                out.delivery_tag = env->DeliveryTag();
                out.exchange = env->Exchange();
                out.routing_key = env->RoutingKey();
                out.message_id = message->MessageIdIsSet() ? message->MessageId() : std::string();
                out.content_type = message->ContentTypeIsSet() ? message->ContentType() : std::string();
                out.body = message->Body();
                out.headers.clear();
                if (message->HeaderTableIsSet()) {
                    for (const auto& [key, value] : message->HeaderTable()) {
                        if (value.GetType() == AmqpClient::TableValue::VT_string) {
                            out.headers[key] = value.GetString();
                        }
                    }
                }
                out.redelivered = env->Redelivered();
                pending_[out.delivery_tag] = env;
                return true;
            }
            if (idle) {
                std::this_thread::sleep_for(std::chrono::milliseconds(poll_slice_ms_));
            }
        } while (std::chrono::steady_clock::now() < deadline);

        return false;
    }

    void ack(const delivery& d) override {
        auto env = take(d);
        guarded("ack", [&]() { channel_->BasicAck(env); });
    }

    void nack(const delivery& d, bool requeue) override {
        auto env = take(d);
        guarded("nack", [&]() { channel_->BasicReject(env, requeue, false); });
    }

    void reject(const delivery& d) override {
        nack(d, false);
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return;
        }
        open_ = false;
        pending_.clear();
        tags_.clear();
        channel_.reset();
        LOG_DBG("amqp: channel closed\n");
    }

private:
    template<typename F>
    void guarded(const std::string& what, F&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            throw channel_error("channel closed (" + what + ")");
        }
        try {
            fn();
        } catch (const AmqpClient::ConnectionClosedException & e) {
            open_ = false;
            throw channel_error(what + ": connection closed: " + e.what());
        } catch (const AmqpClient::AmqpException & e) {
            // channel-level exceptions close the channel in AMQP 0-9-1
            open_ = false;
            throw channel_error(what + ": " + e.what());
        } catch (const AmqpClient::AmqpLibraryException & e) {
            open_ = false;
            throw channel_error(what + ": " + e.what());
        }
    }

    AmqpClient::Envelope::ptr_t take(const delivery& d) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(d.delivery_tag);
        if (it == pending_.end()) {
            throw channel_error("unknown delivery tag " + std::to_string(d.delivery_tag));
        }
        auto env = it->second;
        pending_.erase(it);
        return env;
    }

    AmqpClient::Channel::ptr_t channel_;
    int prefetch_;
    int poll_slice_ms_;
    bool open_ = true;
    std::vector<std::string> tags_;
    std::map<uint64_t, AmqpClient::Envelope::ptr_t> pending_;
    mutable std::mutex mutex_;
};

std::unique_ptr<broker_channel> amqp_open(const broker_config& config) {
    try {
        auto opts = AmqpClient::Channel::OpenOpts::FromUri(config.url);
        auto channel = AmqpClient::Channel::Open(opts);
        LOG_DBG("amqp: channel open to %s\n", opts.host.c_str());
        return std::make_unique<amqp_channel>(channel, config);
    } catch (const AmqpClient::BadUriException & e) {
        throw connection_error("invalid broker url '" + config.url + "': " + e.what());
    } catch (const AmqpClient::AmqpLibraryException & e) {
        throw connection_error("cannot reach " + config.url + ": " + e.what());
    } catch (const AmqpClient::AmqpException & e) {
        throw connection_error("broker refused " + config.url + ": " + e.what());
    }
}

channel_factory amqp_channel_factory() {
    return [](const broker_config& config) {
        return amqp_open(config);
    };
}

} // namespace hive
