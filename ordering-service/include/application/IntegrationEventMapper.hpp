#pragma once

#include "domain/events/DomainEvents.hpp"
#include "domain/events/IntegrationEvents.hpp"
#include "domain/OutboxRecord.hpp"
#include "utils/UuidGenerator.hpp"
#include <type_traits>
#include <variant>

namespace ordering::application {

/**
 * @brief Доменное событие -> интеграционное событие -> строка outbox
 *
 * Каждое интеграционное событие получает новый eventId, по которому
 * потребители отбрасывают повторные доставки.
 */
class IntegrationEventMapper {
public:
    static domain::IntegrationEvent map(const domain::DomainEvent& event, const domain::Timestamp& now) {
        using namespace domain;

        return std::visit([&now](const auto& e) -> IntegrationEvent {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, OrderStartedDomainEvent>) {
                return OrderStartedIntegrationEvent{
                    header(e.orderId, e.buyerId, OrderStatus::SUBMITTED, now),
                    e.buyerName, e.orderDate};
            } else if constexpr (std::is_same_v<T, OrderStatusChangedToAwaitingValidationDomainEvent>) {
                return OrderStatusChangedToAwaitingValidationIntegrationEvent{
                    header(e.orderId, e.buyerId, OrderStatus::AWAITING_VALIDATION, now),
                    e.stockItems};
            } else if constexpr (std::is_same_v<T, OrderStatusChangedToStockConfirmedDomainEvent>) {
                return OrderStockConfirmedIntegrationEvent{
                    header(e.orderId, e.buyerId, OrderStatus::STOCK_CONFIRMED, now)};
            } else if constexpr (std::is_same_v<T, OrderStockRejectedDomainEvent>) {
                return OrderStockRejectedIntegrationEvent{
                    header(e.orderId, e.buyerId, OrderStatus::CANCELLED, now),
                    e.rejectedProductIds};
            } else if constexpr (std::is_same_v<T, OrderStatusChangedToPaidDomainEvent>) {
                return OrderPaidIntegrationEvent{
                    header(e.orderId, e.buyerId, OrderStatus::PAID, now),
                    e.stockItems, e.total};
            } else if constexpr (std::is_same_v<T, OrderShippedDomainEvent>) {
                return OrderShippedIntegrationEvent{
                    header(e.orderId, e.buyerId, OrderStatus::SHIPPED, now)};
            } else {
                static_assert(std::is_same_v<T, OrderCancelledDomainEvent>, "unhandled domain event");
                return OrderCancelledIntegrationEvent{
                    header(e.orderId, e.buyerId, OrderStatus::CANCELLED, now),
                    e.previousStatus};
            }
        }, event);
    }

    /**
     * @brief Новая строка outbox (CREATED, timesSent = 0)
     */
    static domain::OutboxRecord toOutboxRecord(const domain::IntegrationEvent& event) {
        const auto& h = domain::headerOf(event);

        domain::OutboxRecord record;
        record.eventId = h.eventId;
        record.eventType = domain::routingKeyOf(event);
        record.content = domain::toJson(event);
        record.orderId = h.orderId;
        record.createdAt = h.createdAt;
        record.state = domain::EventState::CREATED;
        record.timesSent = 0;
        return record;
    }

private:
    static domain::IntegrationEventHeader header(const std::string& orderId, const std::string& buyerId,
                                                 domain::OrderStatus status, const domain::Timestamp& now) {
        return domain::IntegrationEventHeader{utils::UuidGenerator::generate(), orderId, buyerId, status, now};
    }
};

} // namespace ordering::application
