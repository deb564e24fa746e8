#pragma once

#include "domain/Order.hpp"
#include "domain/OutboxRecord.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ordering::ports::input {

/**
 * @brief Чтение заказов и их outbox-истории
 */
class IOrderQueryService {
public:
    virtual ~IOrderQueryService() = default;

    virtual std::optional<domain::Order> getOrderById(const std::string& orderId) = 0;

    virtual std::vector<domain::Order> getOrdersByBuyer(const std::string& buyerId) = 0;

    /**
     * @brief Интеграционные события заказа в порядке создания
     */
    virtual std::vector<domain::OutboxRecord> getOrderEvents(const std::string& orderId) = 0;
};

} // namespace ordering::ports::input
