#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/persistence/PostgresRowMapper.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ordering::adapters::secondary {

/**
 * @brief Чтение заказов из PostgreSQL
 */
class PostgresOrderRepository : public ports::output::IOrderRepository {
public:
    explicit PostgresOrderRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {}

    std::optional<domain::Order> findById(const std::string& orderId) override {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::read_transaction txn(c);

        auto rows = txn.exec_params(
            std::string("SELECT ") + postgres::ORDER_COLUMNS + " FROM orders WHERE id = $1",
            orderId);
        if (rows.empty()) {
            return std::nullopt;
        }
        return postgres::rowToOrder(txn, rows[0]);
    }

    std::vector<domain::Order> findByBuyerId(const std::string& buyerId) override {
        pqxx::connection c(settings_->getConnectionString());
        pqxx::read_transaction txn(c);

        auto rows = txn.exec_params(
            std::string("SELECT ") + postgres::ORDER_COLUMNS +
            " FROM orders WHERE buyer_id = $1 ORDER BY order_date DESC",
            buyerId);

        std::vector<domain::Order> orders;
        orders.reserve(rows.size());
        for (const auto& row : rows) {
            orders.push_back(postgres::rowToOrder(txn, row));
        }
        return orders;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ordering::adapters::secondary
