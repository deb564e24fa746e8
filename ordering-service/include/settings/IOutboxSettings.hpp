#pragma once

#include <chrono>
#include <cstddef>

namespace ordering::settings {

/**
 * @brief Параметры outbox relay
 */
class IOutboxSettings {
public:
    virtual ~IOutboxSettings() = default;

    virtual size_t getBatchSize() const = 0;
    virtual std::chrono::milliseconds getPollInterval() const = 0;

    /**
     * @brief Время аренды захваченной строки. После истечения строку
     *        может забрать другой relay.
     */
    virtual std::chrono::milliseconds getLeaseTimeout() const = 0;

    /**
     * @brief Максимум попыток публикации, после чего строка остаётся в FAILED
     */
    virtual int getMaxAttempts() const = 0;

    virtual std::chrono::milliseconds getBackoffBase() const = 0;
    virtual std::chrono::milliseconds getBackoffMax() const = 0;

    /**
     * @brief Сколько хранить опубликованные строки до очистки
     */
    virtual std::chrono::hours getRetention() const = 0;
};

} // namespace ordering::settings
