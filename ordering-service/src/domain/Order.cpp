#include "domain/Order.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace ordering::domain {

Order::Order(std::string id, std::string buyerId, std::string buyerName,
             Address address, PaymentCard card, Timestamp orderDate)
    : id_(std::move(id))
    , buyerId_(std::move(buyerId))
    , buyerName_(std::move(buyerName))
    , address_(std::move(address))
    , card_(std::move(card))
    , orderDate_(orderDate)
    , status_(OrderStatus::SUBMITTED)
{
    domainEvents_.emplace_back(OrderStartedDomainEvent{id_, buyerId_, buyerName_, orderDate_});
}

Order Order::rehydrate(OrderData data) {
    Order order;
    order.id_ = std::move(data.id);
    order.buyerId_ = std::move(data.buyerId);
    order.buyerName_ = std::move(data.buyerName);
    order.address_ = std::move(data.address);
    order.card_ = std::move(data.card);
    order.orderDate_ = data.orderDate;
    order.status_ = data.status;
    order.description_ = std::move(data.description);
    order.items_ = std::move(data.items);
    order.version_ = data.version;
    return order;
}

std::optional<DomainError> Order::addOrderItem(int64_t productId, const std::string& productName,
                                               const Money& unitPrice, const Money& discount,
                                               const std::string& pictureUrl, int units) {
    static const std::string transition = "addOrderItem";

    if (units <= 0) {
        return DomainError::validation(transition, "Invalid number of units: " + std::to_string(units));
    }
    if (unitPrice.isNegative() || discount.isNegative()) {
        return DomainError::validation(transition, "Price and discount must not be negative");
    }
    if (discount.currency != unitPrice.currency ||
        (!items_.empty() && items_.front().getUnitPrice().currency != unitPrice.currency)) {
        return DomainError::validation(transition, "All order amounts must use one currency");
    }

    auto existing = std::find_if(items_.begin(), items_.end(),
        [productId](const OrderItem& item) { return item.getProductId() == productId; });

    if (existing != items_.end()) {
        if (units > std::numeric_limits<int>::max() - existing->getUnits()) {
            return DomainError::validation(transition, "Too many units of product " + std::to_string(productId));
        }
        int mergedUnits = existing->getUnits() + units;
        if (!existing->getUnitPrice().canMultiplyBy(mergedUnits)) {
            return DomainError::validation(transition, "The total of order item is too large");
        }
        Money newDiscount = discount > existing->getDiscount() ? discount : existing->getDiscount();
        if (existing->getUnitPrice() * mergedUnits < newDiscount) {
            return DomainError::validation(transition, "The total of order item is lower than applied discount");
        }
        if (discount > existing->getDiscount()) {
            existing->setDiscount(discount);
        }
        existing->addUnits(units);
        return std::nullopt;
    }

    if (!unitPrice.canMultiplyBy(units)) {
        return DomainError::validation(transition, "The total of order item is too large");
    }
    if (unitPrice * units < discount) {
        return DomainError::validation(transition, "The total of order item is lower than applied discount");
    }
    if (items_.size() >= MAX_ITEMS) {
        return DomainError::validation(transition,
            "Order cannot have more than " + std::to_string(MAX_ITEMS) + " items");
    }

    items_.emplace_back(productId, productName, unitPrice, discount, pictureUrl, units);
    return std::nullopt;
}

std::optional<DomainError> Order::setAwaitingValidationStatus() {
    if (status_ != OrderStatus::SUBMITTED) {
        return DomainError::invalidTransition("setAwaitingValidationStatus", status_);
    }

    changeStatus(OrderStatus::AWAITING_VALIDATION, "Grace period elapsed, awaiting stock validation.");
    domainEvents_.emplace_back(
        OrderStatusChangedToAwaitingValidationDomainEvent{id_, buyerId_, stockItems()});
    return std::nullopt;
}

std::optional<DomainError> Order::setStockConfirmedStatus() {
    if (status_ != OrderStatus::AWAITING_VALIDATION) {
        return DomainError::invalidTransition("setStockConfirmedStatus", status_);
    }

    changeStatus(OrderStatus::STOCK_CONFIRMED, "All the items were confirmed with available stock.");
    domainEvents_.emplace_back(OrderStatusChangedToStockConfirmedDomainEvent{id_, buyerId_});
    return std::nullopt;
}

std::optional<DomainError> Order::setStockRejectedStatus(const std::vector<int64_t>& rejectedProductIds) {
    if (status_ != OrderStatus::AWAITING_VALIDATION) {
        return DomainError::invalidTransition("setStockRejectedStatus", status_);
    }
    if (rejectedProductIds.empty()) {
        return DomainError::validation("setStockRejectedStatus", "Rejected product list is empty");
    }

    std::ostringstream names;
    bool first = true;
    for (const auto& item : items_) {
        if (std::find(rejectedProductIds.begin(), rejectedProductIds.end(), item.getProductId())
                != rejectedProductIds.end()) {
            if (!first) names << ", ";
            names << item.getProductName();
            first = false;
        }
    }

    changeStatus(OrderStatus::CANCELLED,
                 "The product items don't have stock: (" + names.str() + ").");
    domainEvents_.emplace_back(OrderStockRejectedDomainEvent{id_, buyerId_, rejectedProductIds});
    return std::nullopt;
}

std::optional<DomainError> Order::setPaidStatus() {
    if (status_ != OrderStatus::STOCK_CONFIRMED) {
        return DomainError::invalidTransition("setPaidStatus", status_);
    }

    changeStatus(OrderStatus::PAID, "The payment was performed at a simulated bank.");
    domainEvents_.emplace_back(
        OrderStatusChangedToPaidDomainEvent{id_, buyerId_, stockItems(), getTotal()});
    return std::nullopt;
}

std::optional<DomainError> Order::setShippedStatus() {
    if (status_ != OrderStatus::PAID) {
        return DomainError::invalidTransition("setShippedStatus", status_);
    }

    changeStatus(OrderStatus::SHIPPED, "The order was shipped.");
    domainEvents_.emplace_back(OrderShippedDomainEvent{id_, buyerId_});
    return std::nullopt;
}

std::optional<DomainError> Order::setCancelledStatus() {
    if (status_ == OrderStatus::PAID || status_ == OrderStatus::SHIPPED ||
        status_ == OrderStatus::CANCELLED) {
        return DomainError::invalidTransition("setCancelledStatus", status_);
    }

    OrderStatus previous = status_;
    changeStatus(OrderStatus::CANCELLED, "The order was cancelled.");
    domainEvents_.emplace_back(OrderCancelledDomainEvent{id_, buyerId_, previous});
    return std::nullopt;
}

Money Order::getTotal() const {
    Money total;
    if (!items_.empty()) {
        total.currency = items_.front().getUnitPrice().currency;
    }
    for (const auto& item : items_) {
        total = total + item.getTotal();
    }
    return total;
}

std::vector<DomainEvent> Order::pullDomainEvents() {
    std::vector<DomainEvent> events;
    events.swap(domainEvents_);
    return events;
}

std::vector<OrderStockItem> Order::stockItems() const {
    std::vector<OrderStockItem> result;
    result.reserve(items_.size());
    for (const auto& item : items_) {
        result.push_back(OrderStockItem{item.getProductId(), item.getUnits()});
    }
    return result;
}

void Order::changeStatus(OrderStatus status, const std::string& description) {
    status_ = status;
    description_ = description;
}

} // namespace ordering::domain
