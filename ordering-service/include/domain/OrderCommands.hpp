// ordering-service/include/domain/OrderCommands.hpp
#pragma once

#include "Address.hpp"
#include "Money.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace ordering::domain {

/**
 * @brief Строка заказа во входящей команде
 */
struct OrderItemRequest {
    int64_t productId = 0;
    std::string productName;
    Money unitPrice;
    Money discount;
    std::string pictureUrl;
    int units = 0;
};

/**
 * @brief Данные карты во входящей команде (номер ещё не маскирован)
 */
struct CardRequest {
    std::string cardType;
    std::string cardNumber;
    std::string holderName;
    std::string expiration;
};

/**
 * @brief Создать заказ
 *
 * requestId обязателен: повторная отправка с тем же ключом
 * возвращает уже созданный заказ.
 */
struct CreateOrderCommand {
    std::string requestId;
    std::string buyerId;
    std::string buyerName;
    Address address;
    CardRequest card;
    std::vector<OrderItemRequest> items;
};

/**
 * @brief Истёк grace period: отправить заказ на проверку склада
 */
struct SetAwaitingValidationCommand {
    std::string orderId;
    std::string requestId;
};

/**
 * @brief Ответ склада. Пустой rejectedProductIds означает подтверждение.
 */
struct ConfirmStockCommand {
    std::string orderId;
    std::vector<int64_t> rejectedProductIds;
    std::string requestId;
};

struct MarkPaidCommand {
    std::string orderId;
    std::string requestId;
};

struct MarkShippedCommand {
    std::string orderId;
    std::string requestId;
};

struct CancelOrderCommand {
    std::string orderId;
    std::string requestId;
};

} // namespace ordering::domain
