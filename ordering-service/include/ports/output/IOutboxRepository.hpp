#pragma once

#include "domain/OutboxRecord.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace ordering::ports::output {

/**
 * @brief Outbox: сторона чтения для relay
 *
 * Вставка строк выполняется только через IUnitOfWork.
 */
class IOutboxRepository {
public:
    virtual ~IOutboxRepository() = default;

    /**
     * @brief Атомарно захватить пачку строк для публикации
     *
     * Берутся CREATED, IN_PROGRESS с истёкшей арендой и FAILED с наступившим
     * nextAttemptAt, но только если у того же заказа нет более старой
     * неопубликованной строки. Захваченные строки переходят в IN_PROGRESS,
     * timesSent увеличивается, leaseUntil = now + lease.
     *
     * @return строки в порядке создания (старые первыми)
     */
    virtual std::vector<domain::OutboxRecord> claimPending(size_t batchSize,
                                                           std::chrono::milliseconds lease) = 0;

    /**
     * @brief Брокер подтвердил доставку. No-op, если строка не IN_PROGRESS.
     */
    virtual void markPublished(const std::string& eventId) = 0;

    /**
     * @brief Публикация не удалась. No-op, если строка не IN_PROGRESS.
     * @param nextAttemptAt когда повторить; nullopt - попытки исчерпаны
     */
    virtual void markFailed(const std::string& eventId, const std::string& reason,
                            const std::optional<domain::Timestamp>& nextAttemptAt) = 0;

    /**
     * @brief Вернуть захваченную строку, не расходуя попытку
     *
     * Для случая, когда брокер недоступен: timesSent уменьшается обратно,
     * строка переходит в FAILED и снова берётся после retryAt.
     * No-op, если строка не IN_PROGRESS.
     */
    virtual void releaseClaim(const std::string& eventId, const std::string& reason,
                              const domain::Timestamp& retryAt) = 0;

    virtual std::optional<domain::OutboxRecord> findByEventId(const std::string& eventId) = 0;

    virtual std::vector<domain::OutboxRecord> findByOrderId(const std::string& orderId) = 0;

    virtual std::vector<domain::OutboxRecord> findByState(domain::EventState state) = 0;

    /**
     * @brief Удалить опубликованные строки старше olderThan
     * @return число удалённых строк
     */
    virtual size_t purgePublished(const domain::Timestamp& olderThan) = 0;
};

} // namespace ordering::ports::output
