#pragma once

#include "domain/Timestamp.hpp"

namespace ordering::ports::output {

/**
 * @brief Источник текущего времени
 *
 * Аренды outbox и backoff считаются от него, в тестах подменяется
 * ручными часами.
 */
class IClock {
public:
    virtual ~IClock() = default;
    virtual domain::Timestamp now() const = 0;
};

class SystemClock : public IClock {
public:
    domain::Timestamp now() const override { return domain::Timestamp::now(); }
};

} // namespace ordering::ports::output
