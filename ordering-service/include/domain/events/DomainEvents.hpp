// include/domain/events/DomainEvents.hpp
#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/OrderStatus.hpp"
#include <string>
#include <vector>
#include <variant>
#include <cstdint>

namespace ordering::domain {

/**
 * @brief Позиция для проверки остатков (productId + количество)
 */
struct OrderStockItem {
    int64_t productId = 0;
    int units = 0;
};

struct OrderStartedDomainEvent {
    std::string orderId;
    std::string buyerId;
    std::string buyerName;
    Timestamp orderDate;
};

struct OrderStatusChangedToAwaitingValidationDomainEvent {
    std::string orderId;
    std::string buyerId;
    std::vector<OrderStockItem> stockItems;
};

struct OrderStatusChangedToStockConfirmedDomainEvent {
    std::string orderId;
    std::string buyerId;
};

struct OrderStockRejectedDomainEvent {
    std::string orderId;
    std::string buyerId;
    std::vector<int64_t> rejectedProductIds;
};

struct OrderStatusChangedToPaidDomainEvent {
    std::string orderId;
    std::string buyerId;
    std::vector<OrderStockItem> stockItems;
    Money total;
};

struct OrderShippedDomainEvent {
    std::string orderId;
    std::string buyerId;
};

struct OrderCancelledDomainEvent {
    std::string orderId;
    std::string buyerId;
    OrderStatus previousStatus = OrderStatus::SUBMITTED;
};

/**
 * @brief Доменное событие агрегата Order
 *
 * Живёт только внутри unit of work, который его породил.
 * Закрытый набор вариантов, маппинг в интеграционные события
 * делает IntegrationEventMapper через std::visit.
 */
using DomainEvent = std::variant<
    OrderStartedDomainEvent,
    OrderStatusChangedToAwaitingValidationDomainEvent,
    OrderStatusChangedToStockConfirmedDomainEvent,
    OrderStockRejectedDomainEvent,
    OrderStatusChangedToPaidDomainEvent,
    OrderShippedDomainEvent,
    OrderCancelledDomainEvent>;

} // namespace ordering::domain
