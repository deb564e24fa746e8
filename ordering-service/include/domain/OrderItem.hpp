#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>

namespace ordering::domain {

/**
 * @brief Строка заказа
 *
 * Принадлежит Order и изменяется только через его методы.
 * Наружу отдаётся копией.
 */
class OrderItem {
public:
    OrderItem(int64_t productId, std::string productName, Money unitPrice,
              Money discount, std::string pictureUrl, int units)
        : productId_(productId)
        , productName_(std::move(productName))
        , unitPrice_(std::move(unitPrice))
        , discount_(std::move(discount))
        , pictureUrl_(std::move(pictureUrl))
        , units_(units)
    {}

    int64_t getProductId() const { return productId_; }
    const std::string& getProductName() const { return productName_; }
    const Money& getUnitPrice() const { return unitPrice_; }
    const Money& getDiscount() const { return discount_; }
    const std::string& getPictureUrl() const { return pictureUrl_; }
    int getUnits() const { return units_; }

    /**
     * @brief Сумма строки: цена * количество - скидка
     */
    Money getTotal() const {
        return unitPrice_ * units_ - discount_;
    }

private:
    friend class Order;

    void addUnits(int units) { units_ += units; }
    void setDiscount(const Money& discount) { discount_ = discount; }

    int64_t productId_;
    std::string productName_;
    Money unitPrice_;
    Money discount_;
    std::string pictureUrl_;
    int units_;
};

} // namespace ordering::domain
