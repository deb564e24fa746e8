#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IOutboxRepository.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IClock.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>
#include <vector>

namespace ordering::adapters::secondary {

/**
 * @brief In-memory хранилище заказов, outbox и журнала идемпотентности
 *
 * Одна структура под одним мьютексом, поэтому commit unit of work
 * применяется целиком или не применяется вовсе. Используется в тестах
 * и при ORDERING_STORAGE=memory.
 */
class InMemoryOrderingStore
    : public ports::output::IOrderRepository
    , public ports::output::IOutboxRepository
    , public ports::output::IIdempotencyRepository
    , public ports::output::IUnitOfWorkFactory
    , public std::enable_shared_from_this<InMemoryOrderingStore>
{
public:
    /**
     * @brief Изменения одного unit of work, готовые к применению
     */
    struct Changes {
        std::vector<domain::Order> orders;
        std::vector<domain::OutboxRecord> outbox;
        std::vector<domain::IdempotencyRecord> processed;
    };

    explicit InMemoryOrderingStore(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock))
    {
        std::cout << "[InMemoryOrderingStore] Created" << std::endl;
    }

    // ================================================================
    // IUnitOfWorkFactory
    // ================================================================

    std::unique_ptr<ports::output::IUnitOfWork> begin() override;

    // ================================================================
    // IOrderRepository
    // ================================================================

    std::optional<domain::Order> findById(const std::string& orderId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(orderId);
        if (it == orders_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::Order> findByBuyerId(const std::string& buyerId) override {
        std::vector<domain::Order> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, order] : orders_) {
                if (order.getBuyerId() == buyerId) {
                    result.push_back(order);
                }
            }
        }

        std::sort(result.begin(), result.end(),
            [](const domain::Order& a, const domain::Order& b) {
                return a.getOrderDate() > b.getOrderDate();
            });
        return result;
    }

    // ================================================================
    // IIdempotencyRepository
    // ================================================================

    std::optional<domain::IdempotencyRecord> find(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processed_.find(key);
        if (it == processed_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // ================================================================
    // IOutboxRepository
    // ================================================================

    std::vector<domain::OutboxRecord> claimPending(size_t batchSize,
                                                   std::chrono::milliseconds lease) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();

        std::vector<domain::OutboxRecord> claimed;
        std::set<std::string> blockedOrders;

        for (auto& record : outbox_) {
            if (claimed.size() >= batchSize) {
                break;
            }
            if (record.state == domain::EventState::PUBLISHED) {
                continue;
            }

            bool headOfOrder = blockedOrders.insert(record.orderId).second;
            if (headOfOrder && isClaimable(record, now)) {
                record.state = domain::EventState::IN_PROGRESS;
                record.timesSent += 1;
                record.leaseUntil = now.plus(lease);
                record.nextAttemptAt.reset();
                claimed.push_back(record);
            }
        }
        return claimed;
    }

    void markPublished(const std::string& eventId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* record = findRecord(eventId);
        if (!record || record->state != domain::EventState::IN_PROGRESS) {
            return;
        }
        record->state = domain::EventState::PUBLISHED;
        record->leaseUntil.reset();
    }

    void markFailed(const std::string& eventId, const std::string& reason,
                    const std::optional<domain::Timestamp>& nextAttemptAt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* record = findRecord(eventId);
        if (!record || record->state != domain::EventState::IN_PROGRESS) {
            return;
        }
        record->state = domain::EventState::FAILED;
        record->lastError = reason;
        record->leaseUntil.reset();
        record->nextAttemptAt = nextAttemptAt;
    }

    void releaseClaim(const std::string& eventId, const std::string& reason,
                      const domain::Timestamp& retryAt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* record = findRecord(eventId);
        if (!record || record->state != domain::EventState::IN_PROGRESS) {
            return;
        }
        record->state = domain::EventState::FAILED;
        record->timesSent = std::max(0, record->timesSent - 1);
        record->lastError = reason;
        record->leaseUntil.reset();
        record->nextAttemptAt = retryAt;
    }

    std::optional<domain::OutboxRecord> findByEventId(const std::string& eventId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* record = findRecord(eventId);
        if (!record) {
            return std::nullopt;
        }
        return *record;
    }

    std::vector<domain::OutboxRecord> findByOrderId(const std::string& orderId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::OutboxRecord> result;
        std::copy_if(outbox_.begin(), outbox_.end(), std::back_inserter(result),
            [&orderId](const domain::OutboxRecord& r) { return r.orderId == orderId; });
        return result;
    }

    std::vector<domain::OutboxRecord> findByState(domain::EventState state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::OutboxRecord> result;
        std::copy_if(outbox_.begin(), outbox_.end(), std::back_inserter(result),
            [state](const domain::OutboxRecord& r) { return r.state == state; });
        return result;
    }

    size_t purgePublished(const domain::Timestamp& olderThan) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto before = outbox_.size();
        outbox_.erase(
            std::remove_if(outbox_.begin(), outbox_.end(),
                [&olderThan](const domain::OutboxRecord& r) {
                    return r.state == domain::EventState::PUBLISHED && r.createdAt < olderThan;
                }),
            outbox_.end());
        return before - outbox_.size();
    }

    // ================================================================
    // Для InMemoryUnitOfWork
    // ================================================================

    /**
     * @brief Версия заказа в хранилище (0, если заказа нет)
     */
    int64_t currentVersion(const std::string& orderId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(orderId);
        return it == orders_.end() ? 0 : it->second.getVersion();
    }

    /**
     * @brief Применить изменения атомарно
     * @throws ports::output::ConcurrencyException если версия заказа
     *         изменилась или ключ идемпотентности уже записан
     */
    void apply(const Changes& changes) {
        std::lock_guard<std::mutex> lock(mutex_);

        for (const auto& order : changes.orders) {
            auto it = orders_.find(order.getId());
            int64_t stored = it == orders_.end() ? 0 : it->second.getVersion();
            if (stored != order.getVersion()) {
                throw ports::output::ConcurrencyException(
                    "Order " + order.getId() + " version " + std::to_string(order.getVersion()) +
                    " is stale (stored " + std::to_string(stored) + ")");
            }
        }
        for (const auto& record : changes.processed) {
            if (processed_.count(record.key)) {
                throw ports::output::ConcurrencyException(
                    "Request " + record.key + " is already processed");
            }
        }

        for (const auto& order : changes.orders) {
            domain::Order stored = order;
            stored.pullDomainEvents();
            stored.markPersisted(order.getVersion() + 1);
            orders_.insert_or_assign(order.getId(), std::move(stored));
        }
        for (auto record : changes.outbox) {
            record.sequence = ++sequence_;
            outbox_.push_back(std::move(record));
        }
        for (const auto& record : changes.processed) {
            processed_.emplace(record.key, record);
        }
    }

    size_t orderCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.size();
    }

    size_t outboxSize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outbox_.size();
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
    mutable std::mutex mutex_;
    std::map<std::string, domain::Order> orders_;
    std::vector<domain::OutboxRecord> outbox_;
    std::unordered_map<std::string, domain::IdempotencyRecord> processed_;
    int64_t sequence_ = 0;

    domain::OutboxRecord* findRecord(const std::string& eventId) {
        auto it = std::find_if(outbox_.begin(), outbox_.end(),
            [&eventId](const domain::OutboxRecord& r) { return r.eventId == eventId; });
        return it == outbox_.end() ? nullptr : &*it;
    }

    static bool isClaimable(const domain::OutboxRecord& record, const domain::Timestamp& now) {
        switch (record.state) {
        case domain::EventState::CREATED:
            return true;
        case domain::EventState::IN_PROGRESS:
            return record.leaseUntil && *record.leaseUntil <= now;
        case domain::EventState::FAILED:
            return record.nextAttemptAt && *record.nextAttemptAt <= now;
        case domain::EventState::PUBLISHED:
            return false;
        }
        return false;
    }
};

/**
 * @brief Unit of work над InMemoryOrderingStore
 *
 * Изменения буферизуются и применяются в commit() одним вызовом apply().
 */
class InMemoryUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit InMemoryUnitOfWork(std::shared_ptr<InMemoryOrderingStore> store)
        : store_(std::move(store))
    {}

    ~InMemoryUnitOfWork() override {
        if (!finished_) {
            rollback();
        }
    }

    std::optional<domain::IdempotencyRecord> findProcessed(const std::string& key) override {
        for (const auto& record : changes_.processed) {
            if (record.key == key) {
                return record;
            }
        }
        return store_->find(key);
    }

    std::optional<domain::Order> loadOrder(const std::string& orderId) override {
        return store_->findById(orderId);
    }

    void saveOrder(const domain::Order& order) override {
        ensureActive();
        int64_t stored = store_->currentVersion(order.getId());
        if (stored != order.getVersion()) {
            throw ports::output::ConcurrencyException(
                "Order " + order.getId() + " was modified concurrently");
        }
        auto it = std::find_if(changes_.orders.begin(), changes_.orders.end(),
            [&order](const domain::Order& o) { return o.getId() == order.getId(); });
        if (it != changes_.orders.end()) {
            *it = order;
        } else {
            changes_.orders.push_back(order);
        }
    }

    void addOutboxRecord(const domain::OutboxRecord& record) override {
        ensureActive();
        changes_.outbox.push_back(record);
    }

    void markProcessed(const domain::IdempotencyRecord& record) override {
        ensureActive();
        changes_.processed.push_back(record);
    }

    void commit() override {
        ensureActive();
        finished_ = true;
        store_->apply(changes_);
        changes_ = {};
    }

    void rollback() override {
        finished_ = true;
        changes_ = {};
    }

private:
    std::shared_ptr<InMemoryOrderingStore> store_;
    InMemoryOrderingStore::Changes changes_;
    bool finished_ = false;

    void ensureActive() const {
        if (finished_) {
            throw std::logic_error("Unit of work is already finished");
        }
    }
};

inline std::unique_ptr<ports::output::IUnitOfWork> InMemoryOrderingStore::begin() {
    return std::make_unique<InMemoryUnitOfWork>(shared_from_this());
}

} // namespace ordering::adapters::secondary
