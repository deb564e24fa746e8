#pragma once

#include "enums/OrderStatus.hpp"
#include <string>
#include <optional>

namespace ordering::domain {

/**
 * @brief Вид доменной ошибки
 *
 * Клиентский слой маппит их на ответы: VALIDATION -> 400,
 * INVALID_TRANSITION и CONCURRENCY_CONFLICT -> 409, NOT_FOUND -> 404.
 */
enum class ErrorKind {
    VALIDATION,
    INVALID_TRANSITION,
    CONCURRENCY_CONFLICT,
    NOT_FOUND
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "VALIDATION";
        case ErrorKind::INVALID_TRANSITION: return "INVALID_TRANSITION";
        case ErrorKind::CONCURRENCY_CONFLICT: return "CONCURRENCY_CONFLICT";
        case ErrorKind::NOT_FOUND: return "NOT_FOUND";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Нарушение доменного правила
 *
 * Возвращается значением, не бросается. transition - имя операции,
 * которую пытались выполнить, currentStatus - статус заказа на момент отказа.
 */
struct DomainError {
    ErrorKind kind = ErrorKind::VALIDATION;
    std::string transition;
    std::optional<OrderStatus> currentStatus;
    std::string message;

    static DomainError validation(const std::string& transition, const std::string& message) {
        return DomainError{ErrorKind::VALIDATION, transition, std::nullopt, message};
    }

    static DomainError invalidTransition(const std::string& transition, OrderStatus current) {
        return DomainError{
            ErrorKind::INVALID_TRANSITION, transition, current,
            "Cannot " + transition + ": order is in status " + toString(current)};
    }

    static DomainError conflict(const std::string& transition, const std::string& message) {
        return DomainError{ErrorKind::CONCURRENCY_CONFLICT, transition, std::nullopt, message};
    }

    static DomainError notFound(const std::string& transition, const std::string& orderId) {
        return DomainError{ErrorKind::NOT_FOUND, transition, std::nullopt, "Order not found: " + orderId};
    }
};

} // namespace ordering::domain
