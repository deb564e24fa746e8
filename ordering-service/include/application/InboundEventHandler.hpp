// ordering-service/include/application/InboundEventHandler.hpp
#pragma once

#include "ports/output/IEventConsumer.hpp"
#include "ports/input/IOrderCommandService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "application/CommandDispatcher.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace ordering::application {

/**
 * @brief Обработчик событий других сервисов
 *
 * Слушает integration.events exchange:
 * - grace_period.confirmed → confirmGracePeriod
 * - stock.confirmed → confirmStock
 * - stock.rejected → confirmStock(rejected_product_ids)
 * - payment.succeeded → markPaid
 * - payment.failed → cancelOrder
 *
 * Ключ идемпотентности команды: "evt:" + event_id, поэтому повторная
 * доставка того же события заказ не меняет.
 *
 * Команда ставится в шард диспетчера по order_id: события одного заказа
 * выполняются в порядке доставки. Доставка подтверждается после
 * выполнения команды:
 * - успех или доменный отказ -> ACK (повтор дал бы тот же отказ)
 * - CONCURRENCY_CONFLICT или исключение хранилища -> REQUEUE
 * - испорченное или неизвестное событие -> REJECT
 */
class InboundEventHandler {
public:
    InboundEventHandler(
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer,
        std::shared_ptr<ports::input::IOrderCommandService> commandService,
        std::shared_ptr<CommandDispatcher> dispatcher,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : eventConsumer_(std::move(eventConsumer))
      , commandService_(std::move(commandService))
      , dispatcher_(std::move(dispatcher))
      , metrics_(std::move(metrics))
    {
        std::cout << "[InboundEventHandler] Created" << std::endl;
        subscribe();
    }

    /**
     * @brief Разобрать событие и поставить команду в очередь
     * @param settle вызывается ровно один раз, когда исход доставки известен
     * @return false, если событие отброшено или не поставлено
     */
    bool handle(const std::string& routingKey, const std::string& message,
                ports::output::DeliveryCallback settle = {}) {
        using ports::output::DeliveryOutcome;
        metrics_->increment("events_received_total", {{"event", routingKey}});

        auto done = [settle](DeliveryOutcome outcome) {
            if (settle) {
                settle(outcome);
            }
        };

        std::string eventId;
        std::string orderId;
        std::vector<int64_t> rejected;
        try {
            auto json = nlohmann::json::parse(message);
            eventId = json.value("event_id", "");
            orderId = json.value("order_id", "");
            rejected = json.value("rejected_product_ids", std::vector<int64_t>{});
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[InboundEventHandler] Malformed " << routingKey << ": " << e.what() << std::endl;
            done(DeliveryOutcome::REJECT);
            return false;
        }

        if (eventId.empty() || orderId.empty()) {
            std::cerr << "[InboundEventHandler] Dropped " << routingKey
                      << ": event_id and order_id are required" << std::endl;
            done(DeliveryOutcome::REJECT);
            return false;
        }

        std::string requestId = "evt:" + eventId;
        auto service = commandService_;
        std::shared_ptr<ICommand> command;

        if (routingKey == "grace_period.confirmed") {
            domain::SetAwaitingValidationCommand cmd{orderId, requestId};
            command = makeCommand(routingKey, orderId, done,
                                  [service, cmd]() { return service->confirmGracePeriod(cmd); });
        } else if (routingKey == "stock.confirmed") {
            domain::ConfirmStockCommand cmd{orderId, {}, requestId};
            command = makeCommand(routingKey, orderId, done,
                                  [service, cmd]() { return service->confirmStock(cmd); });
        } else if (routingKey == "stock.rejected") {
            if (rejected.empty()) {
                std::cerr << "[InboundEventHandler] Dropped stock.rejected for order " << orderId
                          << ": rejected_product_ids is empty" << std::endl;
                done(DeliveryOutcome::REJECT);
                return false;
            }
            domain::ConfirmStockCommand cmd{orderId, rejected, requestId};
            command = makeCommand(routingKey, orderId, done,
                                  [service, cmd]() { return service->confirmStock(cmd); });
        } else if (routingKey == "payment.succeeded") {
            domain::MarkPaidCommand cmd{orderId, requestId};
            command = makeCommand(routingKey, orderId, done,
                                  [service, cmd]() { return service->markPaid(cmd); });
        } else if (routingKey == "payment.failed") {
            domain::CancelOrderCommand cmd{orderId, requestId};
            command = makeCommand(routingKey, orderId, done,
                                  [service, cmd]() { return service->cancelOrder(cmd); });
        } else {
            std::cerr << "[InboundEventHandler] Unknown routing key: " << routingKey << std::endl;
            done(DeliveryOutcome::REJECT);
            return false;
        }

        if (!dispatcher_->dispatch(orderId, command)) {
            std::cerr << "[InboundEventHandler] Dispatcher stopped, requeued " << routingKey
                      << " for order " << orderId << std::endl;
            done(DeliveryOutcome::REQUEUE);
            return false;
        }
        return true;
    }

    static std::vector<std::string> routingKeys() {
        return {"grace_period.confirmed", "stock.confirmed", "stock.rejected",
                "payment.succeeded", "payment.failed"};
    }

private:
    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<ports::input::IOrderCommandService> commandService_;
    std::shared_ptr<CommandDispatcher> dispatcher_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    void subscribe() {
        std::cout << "[InboundEventHandler] Subscribing to grace_period.*, stock.*, payment.*" << std::endl;

        eventConsumer_->subscribe(
            routingKeys(),
            [this](const std::string& routingKey, const std::string& message,
                   ports::output::DeliveryCallback settle) {
                handle(routingKey, message, std::move(settle));
            }
        );
    }

    template <typename Settle, typename Call>
    static std::shared_ptr<ICommand> makeCommand(const std::string& routingKey, const std::string& orderId,
                                                 Settle settle, Call call) {
        using ports::output::DeliveryOutcome;
        return std::make_shared<FunctionCommand>(
            routingKey + " order=" + orderId,
            [routingKey, orderId, settle, call]() {
                domain::CommandResult result;
                try {
                    result = call();
                } catch (const std::exception&) {
                    settle(DeliveryOutcome::REQUEUE);
                    throw;
                }

                if (!result.success && result.error) {
                    std::cerr << "[InboundEventHandler] " << routingKey << " for order " << orderId
                              << " rejected: " << result.error->message << std::endl;
                    if (result.error->kind == domain::ErrorKind::CONCURRENCY_CONFLICT) {
                        settle(DeliveryOutcome::REQUEUE);
                        return;
                    }
                }
                settle(DeliveryOutcome::ACK);
            });
    }
};

} // namespace ordering::application
