// ordering-service/include/ports/input/IOrderCommandService.hpp
#pragma once

#include "domain/OrderCommands.hpp"
#include "domain/CommandResult.hpp"

namespace ordering::ports::input {

/**
 * @brief Интерфейс обработчиков команд над заказом
 *
 * Каждая команда: одна транзакция, один вызов метода агрегата.
 * Ошибки бизнес-правил возвращаются в CommandResult::error.
 * Исключения означают недоступность хранилища.
 */
class IOrderCommandService {
public:
    virtual ~IOrderCommandService() = default;

    virtual domain::CommandResult createOrder(const domain::CreateOrderCommand& command) = 0;

    /**
     * @brief Grace period истёк: SUBMITTED -> AWAITING_VALIDATION
     */
    virtual domain::CommandResult confirmGracePeriod(const domain::SetAwaitingValidationCommand& command) = 0;

    /**
     * @brief Ответ склада: подтверждение или отказ по списку товаров
     */
    virtual domain::CommandResult confirmStock(const domain::ConfirmStockCommand& command) = 0;

    virtual domain::CommandResult markPaid(const domain::MarkPaidCommand& command) = 0;

    virtual domain::CommandResult markShipped(const domain::MarkShippedCommand& command) = 0;

    virtual domain::CommandResult cancelOrder(const domain::CancelOrderCommand& command) = 0;
};

} // namespace ordering::ports::input
