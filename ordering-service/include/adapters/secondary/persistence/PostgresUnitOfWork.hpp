// ordering-service/include/adapters/secondary/persistence/PostgresUnitOfWork.hpp
#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/persistence/PostgresRowMapper.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace ordering::adapters::secondary {

/**
 * @brief Unit of work поверх одной транзакции PostgreSQL
 *
 * loadOrder берёт строку заказа под FOR UPDATE, saveOrder обновляет её
 * только при совпадении версии. Всё видно другим транзакциям после commit().
 */
class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit PostgresUnitOfWork(const std::string& connectionString)
        : connection_(connectionString)
        , txn_(std::make_unique<pqxx::work>(connection_))
    {}

    ~PostgresUnitOfWork() override {
        if (txn_) {
            rollback();
        }
    }

    std::optional<domain::IdempotencyRecord> findProcessed(const std::string& key) override {
        auto rows = active().exec_params(R"(
            SELECT key, command_name, order_id, response_body,
                   (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms
            FROM processed_commands WHERE key = $1
        )", key);
        if (rows.empty()) {
            return std::nullopt;
        }
        return postgres::rowToIdempotencyRecord(rows[0]);
    }

    std::optional<domain::Order> loadOrder(const std::string& orderId) override {
        auto& txn = active();
        auto rows = txn.exec_params(
            std::string("SELECT ") + postgres::ORDER_COLUMNS + " FROM orders WHERE id = $1 FOR UPDATE",
            orderId);
        if (rows.empty()) {
            return std::nullopt;
        }
        return postgres::rowToOrder(txn, rows[0]);
    }

    void saveOrder(const domain::Order& order) override {
        auto& txn = active();

        if (order.getVersion() == 0) {
            insertOrder(txn, order);
            return;
        }

        auto result = txn.exec_params(R"(
            UPDATE orders
            SET status = $2, description = $3, version = version + 1, updated_at = NOW()
            WHERE id = $1 AND version = $4
        )",
            order.getId(),
            domain::toString(order.getStatus()),
            order.getDescription(),
            order.getVersion());

        if (result.affected_rows() == 0) {
            throw ports::output::ConcurrencyException(
                "Order " + order.getId() + " version " + std::to_string(order.getVersion()) + " is stale");
        }
    }

    void addOutboxRecord(const domain::OutboxRecord& record) override {
        active().exec_params(R"(
            INSERT INTO outbox_events (event_id, event_type, content, order_id, created_at, state, times_sent)
            VALUES ($1, $2, $3, $4, to_timestamp($5::double precision / 1000), $6, 0)
        )",
            record.eventId,
            record.eventType,
            record.content,
            record.orderId,
            record.createdAt.toUnixMillis(),
            domain::toString(domain::EventState::CREATED));
    }

    void markProcessed(const domain::IdempotencyRecord& record) override {
        auto result = active().exec_params(R"(
            INSERT INTO processed_commands (key, command_name, order_id, response_body, created_at)
            VALUES ($1, $2, $3, $4, to_timestamp($5::double precision / 1000))
            ON CONFLICT (key) DO NOTHING
        )",
            record.key,
            record.commandName,
            record.orderId,
            record.body,
            record.createdAt.toUnixMillis());

        if (result.affected_rows() == 0) {
            throw ports::output::ConcurrencyException("Request " + record.key + " is already processed");
        }
    }

    void commit() override {
        auto txn = std::move(txn_);
        if (!txn) {
            throw std::logic_error("Unit of work is already finished");
        }
        try {
            txn->commit();
        } catch (const pqxx::serialization_failure& e) {
            throw ports::output::ConcurrencyException(e.what());
        } catch (const pqxx::unique_violation& e) {
            throw ports::output::ConcurrencyException(e.what());
        }
    }

    void rollback() override {
        auto txn = std::move(txn_);
        if (!txn) {
            return;
        }
        try {
            txn->abort();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresUnitOfWork] rollback failed: " << e.what() << std::endl;
        }
    }

private:
    pqxx::connection connection_;
    std::unique_ptr<pqxx::work> txn_;

    pqxx::work& active() {
        if (!txn_) {
            throw std::logic_error("Unit of work is already finished");
        }
        return *txn_;
    }

    static void insertOrder(pqxx::work& txn, const domain::Order& order) {
        const auto& address = order.getAddress();
        const auto& card = order.getCard();

        auto result = txn.exec_params(R"(
            INSERT INTO orders (
                id, buyer_id, buyer_name, street, city, state, country, zip_code,
                card_type, card_number_masked, card_holder_name, card_expiration,
                order_date, status, description, version
            )
            VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12,
                    to_timestamp($13::double precision / 1000), $14, $15, 1)
            ON CONFLICT (id) DO NOTHING
        )",
            order.getId(),
            order.getBuyerId(),
            order.getBuyerName(),
            address.getStreet(),
            address.getCity(),
            address.getState(),
            address.getCountry(),
            address.getZipCode(),
            card.getCardType(),
            card.getMaskedNumber(),
            card.getHolderName(),
            card.getExpiration(),
            order.getOrderDate().toUnixMillis(),
            domain::toString(order.getStatus()),
            order.getDescription());

        if (result.affected_rows() == 0) {
            throw ports::output::ConcurrencyException("Order " + order.getId() + " already exists");
        }

        int position = 0;
        for (const auto& item : order.getOrderItems()) {
            txn.exec_params(R"(
                INSERT INTO order_items (
                    order_id, position, product_id, product_name,
                    unit_price_units, unit_price_nano, discount_units, discount_nano,
                    currency, picture_url, units
                )
                VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)
            )",
                order.getId(),
                position++,
                item.getProductId(),
                item.getProductName(),
                item.getUnitPrice().units,
                item.getUnitPrice().nano,
                item.getDiscount().units,
                item.getDiscount().nano,
                item.getUnitPrice().currency,
                item.getPictureUrl(),
                item.getUnits());
        }
    }
};

/**
 * @brief Новая транзакция на новом соединении для каждого unit of work
 */
class PostgresUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    explicit PostgresUnitOfWorkFactory(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        std::cout << "[PostgresUnitOfWork] Connected to " << settings_->getName() << std::endl;
    }

    std::unique_ptr<ports::output::IUnitOfWork> begin() override {
        return std::make_unique<PostgresUnitOfWork>(settings_->getConnectionString());
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ordering::adapters::secondary
