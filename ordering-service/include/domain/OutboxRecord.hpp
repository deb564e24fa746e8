#pragma once

#include "Timestamp.hpp"
#include "enums/EventState.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ordering::domain {

/**
 * @brief Строка outbox: интеграционное событие, ожидающее доставки
 *
 * content неизменяем после вставки. sequence задаёт порядок создания
 * внутри одного хранилища (createdAt может совпадать до миллисекунды).
 */
struct OutboxRecord {
    std::string eventId;
    std::string eventType;
    std::string content;
    std::string orderId;
    Timestamp createdAt;
    int64_t sequence = 0;
    EventState state = EventState::CREATED;
    int timesSent = 0;
    std::string lastError;
    std::optional<Timestamp> leaseUntil;
    std::optional<Timestamp> nextAttemptAt;
};

} // namespace ordering::domain
