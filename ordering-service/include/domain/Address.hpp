#pragma once

#include <string>
#include <optional>

namespace ordering::domain {

/**
 * @brief Адрес доставки (value object)
 *
 * Неизменяем после создания, сравнивается по значению.
 */
class Address {
public:
    Address() = default;

    Address(std::string street, std::string city, std::string state,
            std::string country, std::string zipCode)
        : street_(std::move(street))
        , city_(std::move(city))
        , state_(std::move(state))
        , country_(std::move(country))
        , zipCode_(std::move(zipCode))
    {}

    const std::string& getStreet() const { return street_; }
    const std::string& getCity() const { return city_; }
    const std::string& getState() const { return state_; }
    const std::string& getCountry() const { return country_; }
    const std::string& getZipCode() const { return zipCode_; }

    /**
     * @brief Имя первого пустого поля, либо nullopt если адрес полный
     */
    std::optional<std::string> findMissingField() const {
        if (street_.empty()) return std::string("street");
        if (city_.empty()) return std::string("city");
        if (state_.empty()) return std::string("state");
        if (country_.empty()) return std::string("country");
        if (zipCode_.empty()) return std::string("zip_code");
        return std::nullopt;
    }

    bool operator==(const Address& other) const {
        return street_ == other.street_ && city_ == other.city_ && state_ == other.state_ &&
               country_ == other.country_ && zipCode_ == other.zipCode_;
    }

    bool operator!=(const Address& other) const { return !(*this == other); }

private:
    std::string street_;
    std::string city_;
    std::string state_;
    std::string country_;
    std::string zipCode_;
};

} // namespace ordering::domain
