#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "ReconnectPolicy.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>

namespace ordering::adapters::secondary {

/**
 * @brief RabbitMQ адаптер с publisher confirms и ручным подтверждением доставок
 *
 * Реализует IEventPublisher и IEventConsumer.
 *
 * - Публикация: topic exchange ordering.events, канал в режиме confirm.
 *   publish() ждёт ack/nack брокера не дольше RABBITMQ_PUBLISH_TIMEOUT_MS.
 *   Без соединения publish() сразу возвращает UNAVAILABLE.
 * - Подписка: durable очередь RABBITMQ_INBOUND_QUEUE на exchange
 *   integration.events. Доставка подтверждается, когда все обработчики
 *   вызвали settle(); до этого брокер держит сообщение за consumer.
 * - Обрыв канала: отложенные confirms получают UNAVAILABLE, соединение
 *   пересоздаётся с экспоненциальной задержкой, привязки восстанавливаются.
 *
 * Все операции с каналом выполняются в потоке io_context.
 */
class RabbitMQAdapter : public ports::output::IEventPublisher,
                        public ports::output::IEventConsumer {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ready_(false)
        , ioContext_()
        , workGuard_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
        , reconnectTimer_(ioContext_)
        , reconnect_(std::chrono::milliseconds(settings_->getReconnectBaseMs()),
                     std::chrono::milliseconds(settings_->getReconnectMaxMs()))
    {
        std::cout << "[RabbitMQAdapter] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " publish=" << settings_->getExchange()
                  << " inbound=" << settings_->getInboundExchange()
                  << " queue=" << settings_->getInboundQueue() << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    // =========================================================================
    // IEventPublisher
    // =========================================================================

    ports::output::PublishAck publish(const std::string& routingKey, const std::string& message) override {
        if (!running_ || !ready_) {
            return ports::output::PublishAck::unavailable("not connected");
        }

        auto promise = std::make_shared<std::promise<ports::output::PublishAck>>();
        auto future = promise->get_future();
        auto tag = std::make_shared<std::atomic<uint64_t>>(0);

        boost::asio::post(ioContext_, [this, routingKey, message, promise, tag]() {
            if (!channel_ || !ready_) {
                promise->set_value(ports::output::PublishAck::unavailable("channel closed"));
                return;
            }

            if (!channel_->publish(settings_->getExchange(), routingKey, message)) {
                promise->set_value(ports::output::PublishAck::nacked("publish rejected by channel"));
                return;
            }
            // ack приходит в этом же потоке, поэтому тег регистрируется до него
            std::lock_guard<std::mutex> lock(confirmsMutex_);
            // Брокер нумерует сообщения в confirm-режиме с 1 на каждом новом канале
            uint64_t deliveryTag = ++deliveryTag_;
            tag->store(deliveryTag);
            pendingConfirms_[deliveryTag] = promise;
        });

        auto timeout = std::chrono::milliseconds(settings_->getPublishTimeoutMs());
        if (future.wait_for(timeout) == std::future_status::ready) {
            auto ack = future.get();
            if (ack.isAcked()) {
                std::cout << "[RabbitMQAdapter] Published " << routingKey << std::endl;
            }
            return ack;
        }

        {
            std::lock_guard<std::mutex> lock(confirmsMutex_);
            pendingConfirms_.erase(tag->load());
        }
        std::cerr << "[RabbitMQAdapter] No confirm for " << routingKey
                  << " within " << timeout.count() << "ms" << std::endl;
        return ports::output::PublishAck::timeout();
    }

    // =========================================================================
    // IEventConsumer
    // =========================================================================

    /**
     * @brief Ключи запоминаются и привязываются заново после каждого переподключения
     */
    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);

        for (const auto& key : routingKeys) {
            handlers_[key].push_back(handler);
            routingKeys_.insert(key);
        }
    }

    void start() override {
        if (running_.exchange(true)) return;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    /**
     * @brief Отправить уже поставленные ack/reject, закрыть соединение
     *
     * Вызывать после остановки диспетчера: подтверждения, которые он
     * успел поставить в io_context, уходят брокеру раньше закрытия.
     */
    void stop() override {
        if (!running_.exchange(false)) return;

        ready_ = false;
        workGuard_.reset();
        boost::asio::post(ioContext_, [this]() {
            reconnectTimer_.cancel();
            if (connection_) {
                connection_->close();
            }
            boost::asio::post(ioContext_, [this]() { ioContext_.stop(); });
        });

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        failPending(ports::output::PublishAck::unavailable("adapter stopped"));
        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

    bool isReady() const { return ready_; }

private:
    /**
     * @brief Исход доставки, общий для всех обработчиков одного routing key
     *
     * Брокеру уходит худший исход: REQUEUE важнее REJECT, REJECT важнее ACK.
     */
    struct PendingDelivery {
        std::mutex mutex;
        size_t remaining = 0;
        ports::output::DeliveryOutcome outcome = ports::output::DeliveryOutcome::ACK;
    };

    void connect() {
        channel_.reset();
        connection_.reset();
        reconnectScheduled_ = false;
        uint64_t generation = ++generation_;

        std::string connStr = "amqp://" + settings_->getUser() + ":" +
                              settings_->getPassword() + "@" +
                              settings_->getHost() + ":" +
                              std::to_string(settings_->getPort()) + "/";

        std::cout << "[RabbitMQAdapter] Connecting (attempt " << reconnect_.attempts() + 1 << ")" << std::endl;

        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_, AMQP::Address(connStr));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());
        {
            std::lock_guard<std::mutex> lock(confirmsMutex_);
            deliveryTag_ = 0;
        }

        channel_->onError([this, generation](const char* msg) {
            std::cerr << "[RabbitMQAdapter] Channel error: " << msg << std::endl;
            handleDisconnect(generation, msg);
        });

        channel_->declareExchange(settings_->getExchange(), AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQAdapter] Exchange declared: " << settings_->getExchange() << std::endl;
                enableConfirms();
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange error: " << msg << std::endl;
            });

        channel_->declareExchange(settings_->getInboundExchange(), AMQP::topic, AMQP::durable)
            .onSuccess([this, generation]() {
                std::cout << "[RabbitMQAdapter] Exchange declared: " << settings_->getInboundExchange() << std::endl;
                setupBindings(generation);
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange error: " << msg << std::endl;
            });
    }

    void handleDisconnect(uint64_t generation, const std::string& reason) {
        if (generation != generation_ || reconnectScheduled_) return;

        ready_ = false;
        failPending(ports::output::PublishAck::unavailable(reason));

        if (!running_) return;
        scheduleReconnect();
    }

    void scheduleReconnect() {
        reconnectScheduled_ = true;
        auto delay = reconnect_.nextDelay();
        reconnect_.recordAttempt();

        std::cerr << "[RabbitMQAdapter] Reconnecting in " << delay.count() << "ms" << std::endl;

        reconnectTimer_.expires_after(delay);
        reconnectTimer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec || !running_) return;
            try {
                connect();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Connect failed: " << e.what() << std::endl;
                scheduleReconnect();
            }
        });
    }

    void enableConfirms() {
        channel_->confirmSelect()
            .onSuccess([this]() {
                ready_ = true;
                reconnect_.reset();
                std::cout << "[RabbitMQAdapter] Publisher confirms enabled" << std::endl;
            })
            .onAck([this](uint64_t deliveryTag, bool multiple) {
                resolve(deliveryTag, multiple, ports::output::PublishAck::acked());
            })
            .onNack([this](uint64_t deliveryTag, bool multiple, bool) {
                resolve(deliveryTag, multiple, ports::output::PublishAck::nacked("nacked by broker"));
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Confirm mode error: " << msg << std::endl;
            });
    }

    void setupBindings(uint64_t generation) {
        channel_->declareQueue(settings_->getInboundQueue(), AMQP::durable)
            .onSuccess([this, generation](const std::string& name, uint32_t messages, uint32_t) {
                queueName_ = name;
                std::cout << "[RabbitMQAdapter] Queue declared: " << queueName_
                          << " (" << messages << " waiting)" << std::endl;

                {
                    std::lock_guard<std::mutex> lock(handlersMutex_);
                    for (const auto& key : routingKeys_) {
                        channel_->bindQueue(settings_->getInboundExchange(), queueName_, key);
                        std::cout << "[RabbitMQAdapter] Bound: " << key << std::endl;
                    }
                }

                channel_->setQos(static_cast<uint16_t>(std::max(1, settings_->getPrefetch())));
                startConsuming(generation);
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Queue error: " << msg << std::endl;
            });
    }

    void startConsuming(uint64_t generation) {
        channel_->consume(queueName_)
            .onReceived([this, generation](const AMQP::Message& msg, uint64_t tag, bool redelivered) {
                std::string routingKey = msg.routingkey();
                std::string body(msg.body(), msg.bodySize());

                std::cout << "[RabbitMQAdapter] Received " << routingKey
                          << (redelivered ? " (redelivered)" : "") << std::endl;

                deliver(generation, tag, routingKey, body);
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Consume error: " << msg << std::endl;
            });
    }

    void deliver(uint64_t generation, uint64_t tag, const std::string& routingKey, const std::string& body) {
        std::vector<ports::output::EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            auto it = handlers_.find(routingKey);
            if (it != handlers_.end()) {
                handlers = it->second;
            }
        }

        if (handlers.empty()) {
            std::cerr << "[RabbitMQAdapter] No handler for " << routingKey << std::endl;
            settle(generation, tag, ports::output::DeliveryOutcome::REJECT);
            return;
        }

        auto pending = std::make_shared<PendingDelivery>();
        pending->remaining = handlers.size();

        for (const auto& handler : handlers) {
            auto once = std::make_shared<std::atomic<bool>>(false);
            ports::output::DeliveryCallback done =
                [this, generation, tag, pending, once](ports::output::DeliveryOutcome outcome) {
                    if (once->exchange(true)) return;

                    ports::output::DeliveryOutcome result;
                    {
                        std::lock_guard<std::mutex> lock(pending->mutex);
                        if (static_cast<int>(outcome) > static_cast<int>(pending->outcome)) {
                            pending->outcome = outcome;
                        }
                        if (--pending->remaining > 0) return;
                        result = pending->outcome;
                    }
                    boost::asio::post(ioContext_, [this, generation, tag, result]() {
                        settle(generation, tag, result);
                    });
                };

            try {
                handler(routingKey, body, done);
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Handler error: " << e.what() << std::endl;
                done(ports::output::DeliveryOutcome::REQUEUE);
            }
        }
    }

    /**
     * @brief Подтвердить доставку брокеру (поток io_context)
     *
     * Тег принадлежит каналу, на котором пришло сообщение. После
     * переподключения старые теги недействительны: брокер сам
     * доставит такие сообщения заново.
     */
    void settle(uint64_t generation, uint64_t tag, ports::output::DeliveryOutcome outcome) {
        if (generation != generation_ || !channel_) {
            std::cerr << "[RabbitMQAdapter] Delivery " << tag
                      << " belongs to a closed channel, broker will redeliver" << std::endl;
            return;
        }

        switch (outcome) {
            case ports::output::DeliveryOutcome::ACK:
                channel_->ack(tag);
                break;
            case ports::output::DeliveryOutcome::REQUEUE:
                channel_->reject(tag, AMQP::requeue);
                break;
            case ports::output::DeliveryOutcome::REJECT:
                channel_->reject(tag);
                break;
        }
    }

    /**
     * @brief ack/nack брокера; multiple = true закрывает все теги <= deliveryTag
     */
    void resolve(uint64_t deliveryTag, bool multiple, const ports::output::PublishAck& ack) {
        std::lock_guard<std::mutex> lock(confirmsMutex_);
        auto first = multiple ? pendingConfirms_.begin() : pendingConfirms_.find(deliveryTag);
        auto last = pendingConfirms_.upper_bound(deliveryTag);
        if (first == pendingConfirms_.end()) {
            return;
        }
        for (auto it = first; it != last; ++it) {
            it->second->set_value(ack);
        }
        pendingConfirms_.erase(first, last);
    }

    void failPending(const ports::output::PublishAck& ack) {
        std::lock_guard<std::mutex> lock(confirmsMutex_);
        for (auto& [tag, promise] : pendingConfirms_) {
            promise->set_value(ack);
        }
        pendingConfirms_.clear();
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string queueName_;

    std::atomic<bool> running_;
    std::atomic<bool> ready_;
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    // Только поток io_context
    boost::asio::steady_timer reconnectTimer_;
    ReconnectPolicy reconnect_;
    uint64_t generation_ = 0;
    bool reconnectScheduled_ = false;

    std::thread workerThread_;

    std::mutex confirmsMutex_;
    uint64_t deliveryTag_ = 0;
    std::map<uint64_t, std::shared_ptr<std::promise<ports::output::PublishAck>>> pendingConfirms_;

    std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
    std::set<std::string> routingKeys_;
};

} // namespace ordering::adapters::secondary
