#pragma once

#include <string>

/**
 * @file ICommand.hpp
 * @brief Единица работы для пула воркеров
 */

/**
 * @brief Команда, исполняемая воркером CommandDispatcher
 *
 * Команда инкапсулирует вызов прикладного сервиса (например, перевод
 * заказа в статус PAID по входящему событию) и ставится в ThreadSafeQueue.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws std::exception при фатальной ошибке (воркер логирует и продолжает)
     */
    virtual void execute() = 0;

    /**
     * @brief Имя команды для логов
     */
    virtual std::string name() const = 0;
};
