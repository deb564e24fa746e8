// include/ports/output/IEventConsumer.hpp
#pragma once

#include <string>
#include <vector>
#include <functional>

namespace ordering::ports::output {

/**
 * @brief Чем закончилась обработка входящего сообщения
 *
 * ACK - обработано (или повтор бессмыслен), брокер удаляет сообщение.
 * REJECT - сообщение испорчено, брокер удаляет его без повтора.
 * REQUEUE - временный сбой, брокер доставит сообщение снова.
 */
enum class DeliveryOutcome { ACK, REJECT, REQUEUE };

/**
 * @brief Подтверждение доставки; обработчик вызывает его ровно один раз,
 *        в том числе из другого потока
 */
using DeliveryCallback = std::function<void(DeliveryOutcome)>;

/**
 * @brief Обработчик входящего события (routingKey + JSON + подтверждение)
 */
using EventHandler = std::function<void(const std::string& routingKey, const std::string& message,
                                        DeliveryCallback settle)>;

/**
 * @brief Интерфейс потребителя событий
 *
 * Сообщение подтверждается брокеру только после settle(), поэтому
 * событие, команда по которому не выполнилась, не теряется.
 *
 * @example
 * ```cpp
 * eventConsumer->subscribe({"stock.confirmed", "stock.rejected"},
 *     [this](const std::string& routingKey, const std::string& message, DeliveryCallback settle) {
 *         handle(routingKey, message, std::move(settle));
 *     });
 * eventConsumer->start();
 * ```
 */
class IEventConsumer {
public:
    virtual ~IEventConsumer() = default;

    virtual void subscribe(const std::vector<std::string>& routingKeys, EventHandler handler) = 0;

    virtual void start() = 0;

    virtual void stop() = 0;
};

} // namespace ordering::ports::output
