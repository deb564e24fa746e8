#pragma once

#include <string>
#include <optional>

namespace ordering::domain {

/**
 * @brief Статус заказа
 *
 * SUBMITTED -> AWAITING_VALIDATION -> STOCK_CONFIRMED -> PAID -> SHIPPED
 * CANCELLED достижим из любого нетерминального статуса, кроме PAID.
 * Отказ склада переводит заказ в CANCELLED.
 */
enum class OrderStatus {
    SUBMITTED,
    AWAITING_VALIDATION,
    STOCK_CONFIRMED,
    PAID,
    SHIPPED,
    CANCELLED
};

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::AWAITING_VALIDATION: return "AWAITING_VALIDATION";
        case OrderStatus::STOCK_CONFIRMED: return "STOCK_CONFIRMED";
        case OrderStatus::PAID: return "PAID";
        case OrderStatus::SHIPPED: return "SHIPPED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

inline std::optional<OrderStatus> parseOrderStatus(const std::string& str) {
    if (str == "SUBMITTED") return OrderStatus::SUBMITTED;
    if (str == "AWAITING_VALIDATION") return OrderStatus::AWAITING_VALIDATION;
    if (str == "STOCK_CONFIRMED") return OrderStatus::STOCK_CONFIRMED;
    if (str == "PAID") return OrderStatus::PAID;
    if (str == "SHIPPED") return OrderStatus::SHIPPED;
    if (str == "CANCELLED") return OrderStatus::CANCELLED;
    return std::nullopt;
}

} // namespace ordering::domain
