#pragma once

#include <string>
#include <cstdint>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace ordering::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Целая часть в units, дробная в nano (10^-9), как в Tinkoff API.
 * После каждой операции units и nano имеют один знак, |nano| < 10^9.
 * Сравнение и арифметика разных валют бросают std::invalid_argument.
 */
class Money {
public:
    int64_t units = 0;
    int32_t nano = 0;
    std::string currency = "USD";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "USD")
        : units(u), nano(n), currency(cur) {}

    static Money fromDouble(double value, const std::string& cur = "USD") {
        Money m;
        m.currency = cur;
        m.units = static_cast<int64_t>(value);
        m.nano = static_cast<int32_t>(std::llround((value - static_cast<double>(m.units)) * 1e9));
        m.normalize();
        return m;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    bool isNegative() const {
        return units < 0 || (units == 0 && nano < 0);
    }

    Money operator+(const Money& other) const {
        requireSameCurrency(other);
        Money result(units + other.units, nano + other.nano, currency);
        result.normalize();
        return result;
    }

    Money operator-(const Money& other) const {
        requireSameCurrency(other);
        Money result(units - other.units, nano - other.nano, currency);
        result.normalize();
        return result;
    }

    /**
     * @brief Помещается ли *this * multiplier в int64 units
     */
    bool canMultiplyBy(int64_t multiplier) const {
        if (multiplier == 0) {
            return true;
        }
        if (multiplier == std::numeric_limits<int64_t>::min()) {
            return units == 0 && nano == 0;
        }
        int64_t limit = std::numeric_limits<int64_t>::max() / (multiplier < 0 ? -multiplier : multiplier);
        int64_t magnitude = units < 0 ? -units : units;
        // строгое неравенство оставляет место под перенос из nano
        return magnitude < limit;
    }

    /**
     * @throws std::overflow_error если результат не помещается в int64
     */
    Money operator*(int64_t multiplier) const {
        if (!canMultiplyBy(multiplier)) {
            throw std::overflow_error("Money overflow: " + std::to_string(units) + " * " +
                                      std::to_string(multiplier));
        }
        int64_t totalNano = static_cast<int64_t>(nano) * (multiplier % NANO_PER_UNIT);
        int64_t carry = static_cast<int64_t>(nano) * (multiplier / NANO_PER_UNIT);
        Money result(units * multiplier + carry + totalNano / NANO_PER_UNIT,
                     static_cast<int32_t>(totalNano % NANO_PER_UNIT), currency);
        result.normalize();
        return result;
    }

    bool operator<(const Money& other) const {
        requireSameCurrency(other);
        return units < other.units || (units == other.units && nano < other.nano);
    }

    bool operator>(const Money& other) const {
        return other < *this;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

private:
    static constexpr int64_t NANO_PER_UNIT = 1000000000;

    void requireSameCurrency(const Money& other) const {
        if (currency != other.currency) {
            throw std::invalid_argument("Currency mismatch: " + currency + " vs " + other.currency);
        }
    }

    void normalize() {
        units += nano / NANO_PER_UNIT;
        nano = static_cast<int32_t>(nano % NANO_PER_UNIT);
        if (units > 0 && nano < 0) {
            units--;
            nano += NANO_PER_UNIT;
        } else if (units < 0 && nano > 0) {
            units++;
            nano -= NANO_PER_UNIT;
        }
    }
};

} // namespace ordering::domain
