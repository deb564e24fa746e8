#pragma once

#include "Timestamp.hpp"
#include <string>

/**
 * Идемпотентность команд
 */
namespace ordering::domain
{

    /**
     * @brief Отметка об обработанной команде
     *
     * body - сериализованный CommandResult, который возвращается
     * при повторной отправке команды с тем же ключом.
     */
    struct IdempotencyRecord
    {
        std::string key;
        std::string commandName;
        std::string orderId;
        std::string body;
        Timestamp createdAt;
    };

} // namespace ordering::domain
