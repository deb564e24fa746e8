#pragma once

#include "ports/output/IEventConsumer.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ordering::tests {

/**
 * @brief IEventConsumer без брокера: события подаются через deliver()
 *
 * Исходы settle() копятся в outcomes(); обработчик может вызвать
 * settle из потока воркера.
 */
class MockEventConsumer : public ports::output::IEventConsumer {
public:
    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        for (const auto& key : routingKeys) {
            handlers_[key].push_back(handler);
        }
    }

    void start() override { started_ = true; }
    void stop() override { started_ = false; }

    /**
     * @return число вызванных обработчиков
     */
    int deliver(const std::string& routingKey, const std::string& message) {
        auto it = handlers_.find(routingKey);
        if (it == handlers_.end()) {
            return 0;
        }
        for (const auto& handler : it->second) {
            handler(routingKey, message, [this](ports::output::DeliveryOutcome outcome) {
                std::lock_guard<std::mutex> lock(mutex_);
                outcomes_.push_back(outcome);
            });
        }
        return static_cast<int>(it->second.size());
    }

    std::vector<ports::output::DeliveryOutcome> outcomes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outcomes_;
    }

    size_t countOutcome(ports::output::DeliveryOutcome outcome) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(outcomes_.begin(), outcomes_.end(), outcome));
    }

    bool isSubscribed(const std::string& routingKey) const {
        return handlers_.count(routingKey) > 0;
    }

    bool isStarted() const { return started_; }

private:
    std::map<std::string, std::vector<ports::output::EventHandler>> handlers_;
    mutable std::mutex mutex_;
    std::vector<ports::output::DeliveryOutcome> outcomes_;
    bool started_ = false;
};

} // namespace ordering::tests
