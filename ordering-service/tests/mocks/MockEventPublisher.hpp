#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace ordering::tests {

/**
 * @brief IEventPublisher для тестов
 *
 * Запоминает все вызовы publish(). Ответы берутся из очереди
 * scriptAck(), когда она пуста, возвращается ACKED.
 */
class MockEventPublisher : public ports::output::IEventPublisher {
public:
    struct PublishedMessage {
        std::string routingKey;
        std::string message;
        ports::output::PublishAck::Status result;
    };

    void scriptAck(ports::output::PublishAck ack) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(ack));
    }

    void scriptAcks(const ports::output::PublishAck& ack, int times) {
        for (int i = 0; i < times; ++i) {
            scriptAck(ack);
        }
    }

    std::vector<PublishedMessage> getPublishedMessages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    /**
     * @brief Только подтверждённые брокером сообщения
     */
    std::vector<PublishedMessage> getAckedMessages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PublishedMessage> acked;
        for (const auto& m : messages_) {
            if (m.result == ports::output::PublishAck::Status::ACKED) {
                acked.push_back(m);
            }
        }
        return acked;
    }

    int publishCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(messages_.size());
    }

    void clearMessages() {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
    }

    ports::output::PublishAck publish(const std::string& routingKey, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto ack = ports::output::PublishAck::acked();
        if (!script_.empty()) {
            ack = script_.front();
            script_.pop_front();
        }
        messages_.push_back({routingKey, message, ack.status});
        return ack;
    }

private:
    mutable std::mutex mutex_;
    std::deque<ports::output::PublishAck> script_;
    std::vector<PublishedMessage> messages_;
};

} // namespace ordering::tests
