#pragma once

#include "DomainError.hpp"
#include "enums/OrderStatus.hpp"
#include <string>
#include <optional>

namespace ordering::domain {

/**
 * @brief Результат команды над заказом
 *
 * Либо итоговый статус заказа, либо типизированная ошибка.
 * replayed = true, если ответ взят из журнала идемпотентности.
 */
struct CommandResult {
    bool success = false;
    std::string orderId;
    std::optional<OrderStatus> status;
    bool replayed = false;
    std::optional<DomainError> error;

    static CommandResult ok(const std::string& orderId, OrderStatus status) {
        CommandResult r;
        r.success = true;
        r.orderId = orderId;
        r.status = status;
        return r;
    }

    static CommandResult fail(const std::string& orderId, DomainError error) {
        CommandResult r;
        r.success = false;
        r.orderId = orderId;
        r.status = error.currentStatus;
        r.error = std::move(error);
        return r;
    }

    /**
     * @brief JSON для журнала идемпотентности
     */
    std::string toJson() const;

    static CommandResult fromJson(const std::string& json);
};

} // namespace ordering::domain
