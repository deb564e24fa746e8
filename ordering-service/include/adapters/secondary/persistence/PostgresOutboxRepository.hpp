// ordering-service/include/adapters/secondary/persistence/PostgresOutboxRepository.hpp
#pragma once

#include "ports/output/IOutboxRepository.hpp"
#include "ports/output/IClock.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/persistence/PostgresRowMapper.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <memory>

namespace ordering::adapters::secondary {

/**
 * @brief Outbox в таблице outbox_events
 *
 * Захват строк одним UPDATE ... WHERE event_id IN (SELECT ... FOR UPDATE
 * SKIP LOCKED): несколько relay не получат одну строку одновременно.
 * Строка берётся, только если у её заказа нет более старой неопубликованной.
 */
class PostgresOutboxRepository : public ports::output::IOutboxRepository {
public:
    PostgresOutboxRepository(
        std::shared_ptr<settings::DbSettings> settings,
        std::shared_ptr<ports::output::IClock> clock
    ) : settings_(std::move(settings))
      , clock_(std::move(clock))
    {}

    std::vector<domain::OutboxRecord> claimPending(size_t batchSize,
                                                   std::chrono::milliseconds lease) override {
        auto now = clock_->now();

        pqxx::connection c(settings_->getConnectionString());
        pqxx::work txn(c);

        auto rows = txn.exec_params(
            std::string(R"(
                UPDATE outbox_events
                SET state = 'IN_PROGRESS',
                    times_sent = times_sent + 1,
                    lease_until = to_timestamp($2::double precision / 1000),
                    next_attempt_at = NULL
                WHERE event_id IN (
                    SELECT c.event_id FROM outbox_events c
                    WHERE (
                        c.state = 'CREATED'
                        OR (c.state = 'IN_PROGRESS' AND c.lease_until <= to_timestamp($3::double precision / 1000))
                        OR (c.state = 'FAILED' AND c.next_attempt_at IS NOT NULL
                            AND c.next_attempt_at <= to_timestamp($3::double precision / 1000))
                    )
                    AND NOT EXISTS (
                        SELECT 1 FROM outbox_events p
                        WHERE p.order_id = c.order_id
                          AND p.sequence < c.sequence
                          AND p.state <> 'PUBLISHED'
                    )
                    ORDER BY c.sequence
                    LIMIT $1
                    FOR UPDATE SKIP LOCKED
                )
                RETURNING )") + postgres::OUTBOX_COLUMNS,
            static_cast<int64_t>(batchSize),
            now.plus(lease).toUnixMillis(),
            now.toUnixMillis());

        txn.commit();

        std::vector<domain::OutboxRecord> claimed;
        claimed.reserve(rows.size());
        for (const auto& row : rows) {
            claimed.push_back(postgres::rowToOutboxRecord(row));
        }
        std::sort(claimed.begin(), claimed.end(),
            [](const domain::OutboxRecord& a, const domain::OutboxRecord& b) {
                return a.sequence < b.sequence;
            });
        return claimed;
    }

    void markPublished(const std::string& eventId) override {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work txn(c);
        txn.exec_params(R"(
            UPDATE outbox_events
            SET state = 'PUBLISHED', lease_until = NULL, published_at = NOW()
            WHERE event_id = $1 AND state = 'IN_PROGRESS'
        )", eventId);
        txn.commit();
    }

    void markFailed(const std::string& eventId, const std::string& reason,
                    const std::optional<domain::Timestamp>& nextAttemptAt) override {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work txn(c);
        txn.exec_params(R"(
            UPDATE outbox_events
            SET state = 'FAILED',
                last_error = $2,
                lease_until = NULL,
                next_attempt_at = to_timestamp($3::double precision / 1000)
            WHERE event_id = $1 AND state = 'IN_PROGRESS'
        )", eventId, reason, postgres::optionalMillis(nextAttemptAt));
        txn.commit();
    }

    void releaseClaim(const std::string& eventId, const std::string& reason,
                      const domain::Timestamp& retryAt) override {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work txn(c);
        txn.exec_params(R"(
            UPDATE outbox_events
            SET state = 'FAILED',
                times_sent = GREATEST(times_sent - 1, 0),
                last_error = $2,
                lease_until = NULL,
                next_attempt_at = to_timestamp($3::double precision / 1000)
            WHERE event_id = $1 AND state = 'IN_PROGRESS'
        )", eventId, reason, retryAt.toUnixMillis());
        txn.commit();
    }

    std::optional<domain::OutboxRecord> findByEventId(const std::string& eventId) override {
        auto rows = select("WHERE event_id = $1", eventId);
        if (rows.empty()) {
            return std::nullopt;
        }
        return rows.front();
    }

    std::vector<domain::OutboxRecord> findByOrderId(const std::string& orderId) override {
        return select("WHERE order_id = $1 ORDER BY sequence", orderId);
    }

    std::vector<domain::OutboxRecord> findByState(domain::EventState state) override {
        return select("WHERE state = $1 ORDER BY sequence", domain::toString(state));
    }

    size_t purgePublished(const domain::Timestamp& olderThan) override {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::work txn(c);
        auto result = txn.exec_params(R"(
            DELETE FROM outbox_events
            WHERE state = 'PUBLISHED' AND created_at < to_timestamp($1::double precision / 1000)
        )", olderThan.toUnixMillis());
        txn.commit();
        return static_cast<size_t>(result.affected_rows());
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;

    std::vector<domain::OutboxRecord> select(const std::string& where, const std::string& param) {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::read_transaction txn(c);
        auto rows = txn.exec_params(
            std::string("SELECT ") + postgres::OUTBOX_COLUMNS + " FROM outbox_events " + where,
            param);

        std::vector<domain::OutboxRecord> records;
        records.reserve(rows.size());
        for (const auto& row : rows) {
            records.push_back(postgres::rowToOutboxRecord(row));
        }
        return records;
    }
};

} // namespace ordering::adapters::secondary
