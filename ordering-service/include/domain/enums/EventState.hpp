#pragma once

#include <string>
#include <optional>

namespace ordering::domain {

/**
 * @brief Состояние доставки записи outbox
 *
 * CREATED -> IN_PROGRESS -> PUBLISHED | FAILED
 */
enum class EventState {
    CREATED,
    IN_PROGRESS,
    PUBLISHED,
    FAILED
};

inline std::string toString(EventState state) {
    switch (state) {
        case EventState::CREATED: return "CREATED";
        case EventState::IN_PROGRESS: return "IN_PROGRESS";
        case EventState::PUBLISHED: return "PUBLISHED";
        case EventState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline std::optional<EventState> parseEventState(const std::string& str) {
    if (str == "CREATED") return EventState::CREATED;
    if (str == "IN_PROGRESS") return EventState::IN_PROGRESS;
    if (str == "PUBLISHED") return EventState::PUBLISHED;
    if (str == "FAILED") return EventState::FAILED;
    return std::nullopt;
}

} // namespace ordering::domain
