#pragma once

#include <cstddef>

namespace ordering::settings {

class ICommandSettings {
public:
    virtual ~ICommandSettings() = default;

    /**
     * @brief Сколько раз повторять команду при конфликте версий
     */
    virtual int getMaxRetries() const = 0;

    /**
     * @brief Размер пула потоков CommandDispatcher
     */
    virtual size_t getWorkerCount() const = 0;
};

} // namespace ordering::settings
