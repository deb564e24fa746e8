#pragma once

#include <algorithm>
#include <chrono>

namespace ordering::adapters::secondary {

/**
 * @brief Экспоненциальная задержка переподключения к брокеру
 *
 * delay = base * 2^attempts, не больше max. reset() после успешного
 * подключения возвращает задержку к base.
 */
class ReconnectPolicy {
public:
    ReconnectPolicy(std::chrono::milliseconds base, std::chrono::milliseconds max)
        : base_(base)
        , max_(std::max(base, max))
    {}

    std::chrono::milliseconds nextDelay() const {
        auto delay = base_;
        for (int i = 0; i < attempts_ && delay < max_; ++i) {
            delay *= 2;
        }
        return std::min(delay, max_);
    }

    void recordAttempt() { ++attempts_; }

    void reset() { attempts_ = 0; }

    int attempts() const { return attempts_; }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds max_;
    int attempts_ = 0;
};

} // namespace ordering::adapters::secondary
