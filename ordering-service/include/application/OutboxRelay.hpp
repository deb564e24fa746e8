// ordering-service/include/application/OutboxRelay.hpp
#pragma once

#include "ports/output/IOutboxRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IClock.hpp"
#include "ports/input/IMetricsService.hpp"
#include "settings/IOutboxSettings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace ordering::application {

/**
 * @brief Итог одного цикла relay
 */
struct RelayStats {
    size_t claimed = 0;
    size_t published = 0;
    size_t failed = 0;
    size_t exhausted = 0;
    size_t timedOut = 0;
    size_t released = 0;
};

/**
 * @brief Фоновый поток доставки outbox в брокер
 *
 * Цикл: claimPending -> publish по одной строке в порядке создания.
 * - ACK: markPublished
 * - NACK/исключение: markFailed с backoff min(base * 2^(timesSent-1), max);
 *   при timesSent >= maxAttempts строка остаётся в FAILED навсегда (ALERT в лог)
 * - TIMEOUT: строка остаётся IN_PROGRESS и вернётся после истечения аренды
 * - UNAVAILABLE: нет соединения с брокером; эта и оставшиеся строки пачки
 *   возвращаются через releaseClaim (попытка не расходуется), цикл завершается
 *
 * Строка помечается PUBLISHED только после подтверждения брокера.
 * Просыпается раз в pollInterval или по notify() после commit команды.
 */
class OutboxRelay {
public:
    OutboxRelay(
        std::shared_ptr<ports::output::IOutboxRepository> outbox,
        std::shared_ptr<ports::output::IEventPublisher> publisher,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        std::shared_ptr<settings::IOutboxSettings> settings
    ) : outbox_(std::move(outbox))
      , publisher_(std::move(publisher))
      , clock_(std::move(clock))
      , metrics_(std::move(metrics))
      , settings_(std::move(settings))
      , running_(false)
      , cycleCount_(0)
    {
        std::cout << "[OutboxRelay] Created (batch=" << settings_->getBatchSize()
                  << ", maxAttempts=" << settings_->getMaxAttempts() << ")" << std::endl;
    }

    ~OutboxRelay() {
        stop();
    }

    OutboxRelay(const OutboxRelay&) = delete;
    OutboxRelay& operator=(const OutboxRelay&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        lastPurge_ = clock_->now();
        thread_ = std::thread([this]() { loop(); });
        std::cout << "[OutboxRelay] Started" << std::endl;
    }

    void stop() {
        if (!running_.exchange(false)) return;

        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        std::cout << "[OutboxRelay] Stopped after " << cycleCount_ << " cycles" << std::endl;
    }

    bool isRunning() const { return running_; }

    uint64_t getCycleCount() const { return cycleCount_; }

    /**
     * @brief Разбудить relay (вызывается после commit команды)
     */
    void notify() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_ = true;
        }
        cv_.notify_one();
    }

    /**
     * @brief Один цикл синхронно (для тестов)
     */
    RelayStats runOnce() {
        RelayStats stats;
        auto batch = outbox_->claimPending(settings_->getBatchSize(), settings_->getLeaseTimeout());
        stats.claimed = batch.size();

        // Заказ, у которого строка не ушла, в этом цикле больше не публикуем
        std::set<std::string> blockedOrders;

        for (size_t i = 0; i < batch.size(); ++i) {
            const auto& record = batch[i];
            if (blockedOrders.count(record.orderId)) {
                outbox_->markFailed(record.eventId, "blocked by an earlier event of the same order",
                                    clock_->now());
                continue;
            }

            auto ack = publish(record);

            switch (ack.status) {
            case ports::output::PublishAck::Status::ACKED:
                outbox_->markPublished(record.eventId);
                metrics_->increment("outbox_published_total");
                ++stats.published;
                break;

            case ports::output::PublishAck::Status::TIMEOUT:
                metrics_->increment("outbox_timeouts_total");
                std::cerr << "[OutboxRelay] No confirm for " << record.eventType
                          << " event=" << record.eventId << ", left in progress" << std::endl;
                blockedOrders.insert(record.orderId);
                ++stats.timedOut;
                break;

            case ports::output::PublishAck::Status::NACKED:
                handleFailure(record, ack.error, stats);
                blockedOrders.insert(record.orderId);
                break;

            case ports::output::PublishAck::Status::UNAVAILABLE:
                releaseRest(batch, i, ack.error, stats);
                i = batch.size();
                break;
            }
        }

        ++cycleCount_;
        if (stats.claimed > 0) {
            std::cout << "[OutboxRelay] Cycle: claimed=" << stats.claimed
                      << " published=" << stats.published
                      << " failed=" << stats.failed
                      << " exhausted=" << stats.exhausted
                      << " timedOut=" << stats.timedOut
                      << " released=" << stats.released << std::endl;
        }
        return stats;
    }

    /**
     * @brief Удалить опубликованные строки старше retention
     */
    size_t purge() {
        auto cutoff = domain::Timestamp(clock_->now().value - settings_->getRetention());
        size_t removed = outbox_->purgePublished(cutoff);
        if (removed > 0) {
            std::cout << "[OutboxRelay] Purged " << removed << " published rows" << std::endl;
        }
        return removed;
    }

    /**
     * @brief Задержка перед следующей попыткой: min(base * 2^(timesSent-1), max)
     */
    std::chrono::milliseconds backoffFor(int timesSent) const {
        auto delay = settings_->getBackoffBase();
        auto limit = settings_->getBackoffMax();
        for (int i = 1; i < timesSent && delay < limit; ++i) {
            delay *= 2;
        }
        return delay < limit ? delay : limit;
    }

private:
    std::shared_ptr<ports::output::IOutboxRepository> outbox_;
    std::shared_ptr<ports::output::IEventPublisher> publisher_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    std::shared_ptr<settings::IOutboxSettings> settings_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> cycleCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool pending_ = false;
    domain::Timestamp lastPurge_;

    ports::output::PublishAck publish(const domain::OutboxRecord& record) {
        try {
            return publisher_->publish(record.eventType, record.content);
        } catch (const std::exception& e) {
            return ports::output::PublishAck::nacked(e.what());
        }
    }

    void handleFailure(const domain::OutboxRecord& record, const std::string& error, RelayStats& stats) {
        metrics_->increment("outbox_failed_total");
        ++stats.failed;

        if (record.timesSent >= settings_->getMaxAttempts()) {
            outbox_->markFailed(record.eventId, error, std::nullopt);
            metrics_->increment("outbox_exhausted_total");
            ++stats.exhausted;
            std::cerr << "[OutboxRelay] ALERT: " << record.eventType << " event=" << record.eventId
                      << " order=" << record.orderId << " gave up after " << record.timesSent
                      << " attempts: " << error << std::endl;
            return;
        }

        auto delay = backoffFor(record.timesSent);
        outbox_->markFailed(record.eventId, error, clock_->now().plus(delay));
        std::cerr << "[OutboxRelay] Publish failed for " << record.eventType
                  << " event=" << record.eventId << " attempt " << record.timesSent
                  << ", retry in " << delay.count() << "ms: " << error << std::endl;
    }

    /**
     * @brief Брокер недоступен: вернуть batch[from..] без расхода попыток
     */
    void releaseRest(const std::vector<domain::OutboxRecord>& batch, size_t from,
                     const std::string& error, RelayStats& stats) {
        auto retryAt = clock_->now().plus(settings_->getBackoffBase());
        for (size_t i = from; i < batch.size(); ++i) {
            outbox_->releaseClaim(batch[i].eventId, error, retryAt);
            ++stats.released;
        }
        metrics_->increment("outbox_unavailable_total");
        std::cerr << "[OutboxRelay] Broker unavailable (" << error << "), released "
                  << (batch.size() - from) << " rows" << std::endl;
    }

    void loop() {
        while (running_) {
            try {
                RelayStats stats;
                do {
                    stats = runOnce();
                } while (running_ && stats.published > 0);

                purgeIfDue();
            } catch (const std::exception& e) {
                std::cerr << "[OutboxRelay] Cycle error: " << e.what() << std::endl;
            }

            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, settings_->getPollInterval(),
                         [this]() { return pending_ || !running_; });
            pending_ = false;
        }
    }

    void purgeIfDue() {
        auto now = clock_->now();
        if (now.value - lastPurge_.value < std::chrono::hours(1)) {
            return;
        }
        lastPurge_ = now;
        purge();
    }
};

} // namespace ordering::application
