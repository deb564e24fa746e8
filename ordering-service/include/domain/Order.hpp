// ordering-service/include/domain/Order.hpp
#pragma once

#include "Address.hpp"
#include "PaymentCard.hpp"
#include "OrderItem.hpp"
#include "DomainError.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/OrderStatus.hpp"
#include "events/DomainEvents.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace ordering::domain {

/**
 * @brief Сохранённое состояние заказа
 *
 * Используется репозиториями для восстановления агрегата без
 * повторного прохода по переходам (и без генерации событий).
 */
struct OrderData {
    std::string id;
    std::string buyerId;
    std::string buyerName;
    Address address;
    PaymentCard card;
    Timestamp orderDate;
    OrderStatus status = OrderStatus::SUBMITTED;
    std::string description;
    std::vector<OrderItem> items;
    int64_t version = 0;
};

/**
 * @brief Заказ (корень агрегата)
 *
 * Все изменения идут через методы агрегата. Каждый успешный переход
 * статуса кладёт ровно одно доменное событие в staged-список, который
 * забирает unit of work через pullDomainEvents(). При отказе агрегат
 * не меняется и возвращается DomainError.
 */
class Order {
public:
    static constexpr size_t MAX_ITEMS = 100;

    Order(std::string id, std::string buyerId, std::string buyerName,
          Address address, PaymentCard card,
          Timestamp orderDate = Timestamp::now());

    /**
     * @brief Восстановить заказ из хранилища
     */
    static Order rehydrate(OrderData data);

    std::optional<DomainError> addOrderItem(int64_t productId, const std::string& productName,
                                            const Money& unitPrice, const Money& discount,
                                            const std::string& pictureUrl, int units);

    std::optional<DomainError> setAwaitingValidationStatus();
    std::optional<DomainError> setStockConfirmedStatus();
    std::optional<DomainError> setStockRejectedStatus(const std::vector<int64_t>& rejectedProductIds);
    std::optional<DomainError> setPaidStatus();
    std::optional<DomainError> setShippedStatus();
    std::optional<DomainError> setCancelledStatus();

    const std::string& getId() const { return id_; }
    const std::string& getBuyerId() const { return buyerId_; }
    const std::string& getBuyerName() const { return buyerName_; }
    const Address& getAddress() const { return address_; }
    const PaymentCard& getCard() const { return card_; }
    const Timestamp& getOrderDate() const { return orderDate_; }
    OrderStatus getStatus() const { return status_; }
    const std::string& getDescription() const { return description_; }
    int64_t getVersion() const { return version_; }

    /**
     * @brief Копия строк заказа
     */
    std::vector<OrderItem> getOrderItems() const { return items_; }
    size_t getItemCount() const { return items_.size(); }

    Money getTotal() const;

    const std::vector<DomainEvent>& getDomainEvents() const { return domainEvents_; }

    /**
     * @brief Забрать staged-события и очистить список
     */
    std::vector<DomainEvent> pullDomainEvents();

    /**
     * @brief Версия после успешной записи (вызывает unit of work)
     */
    void markPersisted(int64_t version) { version_ = version; }

private:
    Order() = default;

    std::vector<OrderStockItem> stockItems() const;
    void changeStatus(OrderStatus status, const std::string& description);

    std::string id_;
    std::string buyerId_;
    std::string buyerName_;
    Address address_;
    PaymentCard card_;
    Timestamp orderDate_;
    OrderStatus status_ = OrderStatus::SUBMITTED;
    std::string description_;
    std::vector<OrderItem> items_;
    int64_t version_ = 0;

    std::vector<DomainEvent> domainEvents_;
};

} // namespace ordering::domain
