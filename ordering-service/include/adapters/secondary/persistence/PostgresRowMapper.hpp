#pragma once

#include "domain/Order.hpp"
#include "domain/OutboxRecord.hpp"
#include "domain/IdempotencyRecord.hpp"
#include <pqxx/pqxx>
#include <optional>
#include <stdexcept>
#include <string>

namespace ordering::adapters::secondary::postgres {

/**
 * Время хранится в TIMESTAMPTZ, через SQL передаётся как Unix millis:
 * запись to_timestamp($n::double precision / 1000),
 * чтение (EXTRACT(EPOCH FROM col) * 1000)::BIGINT.
 */

inline const char* ORDER_COLUMNS = R"(
    id, buyer_id, buyer_name, street, city, state, country, zip_code,
    card_type, card_number_masked, card_holder_name, card_expiration,
    (EXTRACT(EPOCH FROM order_date) * 1000)::BIGINT AS order_date_ms,
    status, description, version
)";

inline const char* OUTBOX_COLUMNS = R"(
    event_id, event_type, content, order_id,
    (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms,
    sequence, state, times_sent, last_error,
    (EXTRACT(EPOCH FROM lease_until) * 1000)::BIGINT AS lease_until_ms,
    (EXTRACT(EPOCH FROM next_attempt_at) * 1000)::BIGINT AS next_attempt_at_ms
)";

inline std::optional<domain::Timestamp> optionalTimestamp(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return domain::Timestamp::fromUnixMillis(field.as<int64_t>());
}

inline std::optional<int64_t> optionalMillis(const std::optional<domain::Timestamp>& ts) {
    if (!ts) {
        return std::nullopt;
    }
    return ts->toUnixMillis();
}

inline std::vector<domain::OrderItem> loadItems(pqxx::transaction_base& txn, const std::string& orderId) {
    auto rows = txn.exec_params(R"(
        SELECT product_id, product_name, unit_price_units, unit_price_nano,
               discount_units, discount_nano, currency, picture_url, units
        FROM order_items WHERE order_id = $1 ORDER BY position
    )", orderId);

    std::vector<domain::OrderItem> items;
    items.reserve(rows.size());
    for (const auto& row : rows) {
        auto currency = row["currency"].as<std::string>();
        items.emplace_back(
            row["product_id"].as<int64_t>(),
            row["product_name"].as<std::string>(),
            domain::Money(row["unit_price_units"].as<int64_t>(), row["unit_price_nano"].as<int32_t>(), currency),
            domain::Money(row["discount_units"].as<int64_t>(), row["discount_nano"].as<int32_t>(), currency),
            row["picture_url"].is_null() ? std::string() : row["picture_url"].as<std::string>(),
            row["units"].as<int>());
    }
    return items;
}

inline domain::Order rowToOrder(pqxx::transaction_base& txn, const pqxx::row& row) {
    domain::OrderData data;
    data.id = row["id"].as<std::string>();
    data.buyerId = row["buyer_id"].as<std::string>();
    data.buyerName = row["buyer_name"].as<std::string>();
    data.address = domain::Address(
        row["street"].as<std::string>(), row["city"].as<std::string>(),
        row["state"].as<std::string>(), row["country"].as<std::string>(),
        row["zip_code"].as<std::string>());
    data.card = domain::PaymentCard::fromMasked(
        row["card_type"].as<std::string>(), row["card_number_masked"].as<std::string>(),
        row["card_holder_name"].as<std::string>(), row["card_expiration"].as<std::string>());
    data.orderDate = domain::Timestamp::fromUnixMillis(row["order_date_ms"].as<int64_t>());

    auto status = domain::parseOrderStatus(row["status"].as<std::string>());
    if (!status) {
        throw std::runtime_error("Unknown order status in orders." + data.id + ": " +
                                 row["status"].as<std::string>());
    }
    data.status = *status;
    data.description = row["description"].is_null() ? std::string() : row["description"].as<std::string>();
    data.version = row["version"].as<int64_t>();
    data.items = loadItems(txn, data.id);

    return domain::Order::rehydrate(std::move(data));
}

inline domain::OutboxRecord rowToOutboxRecord(const pqxx::row& row) {
    domain::OutboxRecord record;
    record.eventId = row["event_id"].as<std::string>();
    record.eventType = row["event_type"].as<std::string>();
    record.content = row["content"].as<std::string>();
    record.orderId = row["order_id"].as<std::string>();
    record.createdAt = domain::Timestamp::fromUnixMillis(row["created_at_ms"].as<int64_t>());
    record.sequence = row["sequence"].as<int64_t>();

    auto state = domain::parseEventState(row["state"].as<std::string>());
    if (!state) {
        throw std::runtime_error("Unknown outbox state for event " + record.eventId);
    }
    record.state = *state;
    record.timesSent = row["times_sent"].as<int>();
    record.lastError = row["last_error"].is_null() ? std::string() : row["last_error"].as<std::string>();
    record.leaseUntil = optionalTimestamp(row["lease_until_ms"]);
    record.nextAttemptAt = optionalTimestamp(row["next_attempt_at_ms"]);
    return record;
}

inline domain::IdempotencyRecord rowToIdempotencyRecord(const pqxx::row& row) {
    return domain::IdempotencyRecord{
        row["key"].as<std::string>(),
        row["command_name"].as<std::string>(),
        row["order_id"].as<std::string>(),
        row["response_body"].as<std::string>(),
        domain::Timestamp::fromUnixMillis(row["created_at_ms"].as<int64_t>())};
}

} // namespace ordering::adapters::secondary::postgres
