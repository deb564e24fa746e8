// include/domain/events/IntegrationEvents.hpp
#pragma once

#include "DomainEvents.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <vector>
#include <variant>

namespace ordering::domain {

/**
 * @brief Общие поля всех интеграционных событий
 *
 * Потребители дедуплицируют по eventId: доставка at-least-once.
 */
struct IntegrationEventHeader {
    std::string eventId;
    std::string orderId;
    std::string buyerId;
    OrderStatus status = OrderStatus::SUBMITTED;
    Timestamp createdAt;
};

struct OrderStartedIntegrationEvent {
    static constexpr const char* ROUTING_KEY = "order.started";
    IntegrationEventHeader header;
    std::string buyerName;
    Timestamp orderDate;
};

struct OrderStatusChangedToAwaitingValidationIntegrationEvent {
    static constexpr const char* ROUTING_KEY = "order.awaiting_validation";
    IntegrationEventHeader header;
    std::vector<OrderStockItem> stockItems;
};

struct OrderStockConfirmedIntegrationEvent {
    static constexpr const char* ROUTING_KEY = "order.stock_confirmed";
    IntegrationEventHeader header;
};

struct OrderStockRejectedIntegrationEvent {
    static constexpr const char* ROUTING_KEY = "order.stock_rejected";
    IntegrationEventHeader header;
    std::vector<int64_t> rejectedProductIds;
};

struct OrderPaidIntegrationEvent {
    static constexpr const char* ROUTING_KEY = "order.paid";
    IntegrationEventHeader header;
    std::vector<OrderStockItem> stockItems;
    Money total;
};

struct OrderShippedIntegrationEvent {
    static constexpr const char* ROUTING_KEY = "order.shipped";
    IntegrationEventHeader header;
};

struct OrderCancelledIntegrationEvent {
    static constexpr const char* ROUTING_KEY = "order.cancelled";
    IntegrationEventHeader header;
    OrderStatus previousStatus = OrderStatus::SUBMITTED;
};

using IntegrationEvent = std::variant<
    OrderStartedIntegrationEvent,
    OrderStatusChangedToAwaitingValidationIntegrationEvent,
    OrderStockConfirmedIntegrationEvent,
    OrderStockRejectedIntegrationEvent,
    OrderPaidIntegrationEvent,
    OrderShippedIntegrationEvent,
    OrderCancelledIntegrationEvent>;

/**
 * @brief Ключ маршрутизации (тип события) для RabbitMQ
 */
std::string routingKeyOf(const IntegrationEvent& event);

const IntegrationEventHeader& headerOf(const IntegrationEvent& event);

/**
 * @brief Сериализовать событие в JSON (содержимое строки outbox)
 */
std::string toJson(const IntegrationEvent& event);

} // namespace ordering::domain
