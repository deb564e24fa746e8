#include "domain/events/IntegrationEvents.hpp"
#include <nlohmann/json.hpp>
#include <type_traits>

namespace ordering::domain {

namespace {

nlohmann::json headerToJson(const IntegrationEventHeader& h, const std::string& eventType) {
    nlohmann::json j;
    j["event_id"] = h.eventId;
    j["event_type"] = eventType;
    j["order_id"] = h.orderId;
    j["buyer_id"] = h.buyerId;
    j["status"] = toString(h.status);
    j["timestamp"] = h.createdAt.toString();
    return j;
}

nlohmann::json stockItemsToJson(const std::vector<OrderStockItem>& items) {
    auto arr = nlohmann::json::array();
    for (const auto& item : items) {
        arr.push_back({{"product_id", item.productId}, {"units", item.units}});
    }
    return arr;
}

} // namespace

std::string routingKeyOf(const IntegrationEvent& event) {
    return std::visit([](const auto& e) -> std::string {
        return std::decay_t<decltype(e)>::ROUTING_KEY;
    }, event);
}

const IntegrationEventHeader& headerOf(const IntegrationEvent& event) {
    return std::visit([](const auto& e) -> const IntegrationEventHeader& {
        return e.header;
    }, event);
}

std::string toJson(const IntegrationEvent& event) {
    nlohmann::json j = headerToJson(headerOf(event), routingKeyOf(event));

    std::visit([&j](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, OrderStartedIntegrationEvent>) {
            j["buyer_name"] = e.buyerName;
            j["order_date"] = e.orderDate.toString();
        } else if constexpr (std::is_same_v<T, OrderStatusChangedToAwaitingValidationIntegrationEvent>) {
            j["order_stock_items"] = stockItemsToJson(e.stockItems);
        } else if constexpr (std::is_same_v<T, OrderStockRejectedIntegrationEvent>) {
            j["rejected_product_ids"] = e.rejectedProductIds;
        } else if constexpr (std::is_same_v<T, OrderPaidIntegrationEvent>) {
            j["order_stock_items"] = stockItemsToJson(e.stockItems);
            j["total"] = e.total.toDouble();
            j["currency"] = e.total.currency;
        } else if constexpr (std::is_same_v<T, OrderCancelledIntegrationEvent>) {
            j["previous_status"] = toString(e.previousStatus);
        }
    }, event);

    return j.dump();
}

} // namespace ordering::domain
