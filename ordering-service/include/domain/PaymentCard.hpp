#pragma once

#include <string>
#include <optional>

namespace ordering::domain {

/**
 * @brief Описание платёжной карты покупателя
 *
 * Номер хранится только в маскированном виде ("************1234").
 * Задаётся один раз при создании заказа.
 */
class PaymentCard {
public:
    PaymentCard() = default;

    PaymentCard(std::string cardType, const std::string& cardNumber,
                std::string holderName, std::string expiration)
        : cardType_(std::move(cardType))
        , maskedNumber_(mask(cardNumber))
        , holderName_(std::move(holderName))
        , expiration_(std::move(expiration))
    {}

    const std::string& getCardType() const { return cardType_; }
    const std::string& getMaskedNumber() const { return maskedNumber_; }
    const std::string& getHolderName() const { return holderName_; }
    const std::string& getExpiration() const { return expiration_; }

    std::optional<std::string> findMissingField() const {
        if (cardType_.empty()) return std::string("card_type");
        if (maskedNumber_.empty()) return std::string("card_number");
        if (holderName_.empty()) return std::string("card_holder_name");
        if (expiration_.empty()) return std::string("card_expiration");
        return std::nullopt;
    }

    /**
     * @brief Оставить видимыми только последние 4 символа
     *
     * Номер из 4 символов и короче маскируется целиком.
     */
    static std::string mask(const std::string& cardNumber) {
        if (cardNumber.size() <= 4) {
            return std::string(cardNumber.size(), '*');
        }
        return std::string(cardNumber.size() - 4, '*') + cardNumber.substr(cardNumber.size() - 4);
    }

    /**
     * @brief Восстановить из уже маскированного номера (чтение из БД)
     */
    static PaymentCard fromMasked(std::string cardType, std::string maskedNumber,
                                  std::string holderName, std::string expiration) {
        PaymentCard card;
        card.cardType_ = std::move(cardType);
        card.maskedNumber_ = std::move(maskedNumber);
        card.holderName_ = std::move(holderName);
        card.expiration_ = std::move(expiration);
        return card;
    }

    bool operator==(const PaymentCard& other) const {
        return cardType_ == other.cardType_ && maskedNumber_ == other.maskedNumber_ &&
               holderName_ == other.holderName_ && expiration_ == other.expiration_;
    }

private:
    std::string cardType_;
    std::string maskedNumber_;
    std::string holderName_;
    std::string expiration_;
};

} // namespace ordering::domain
