#pragma once

#include "domain/Order.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ordering::ports::output {

/**
 * @brief Интерфейс чтения заказов
 *
 * Output Port для query-стороны. Запись идёт только через IUnitOfWork.
 */
class IOrderRepository {
public:
    virtual ~IOrderRepository() = default;

    /**
     * @brief Найти заказ по ID
     * @return Order или nullopt
     */
    virtual std::optional<domain::Order> findById(const std::string& orderId) = 0;

    /**
     * @brief Все заказы покупателя, новые первыми
     */
    virtual std::vector<domain::Order> findByBuyerId(const std::string& buyerId) = 0;
};

} // namespace ordering::ports::output
