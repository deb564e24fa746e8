// ordering-service/include/application/OrderCommandService.hpp
#pragma once

#include "ports/input/IOrderCommandService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include "ports/output/IClock.hpp"
#include "settings/ICommandSettings.hpp"
#include "application/IntegrationEventMapper.hpp"
#include "application/OrderLockRegistry.hpp"
#include "utils/UuidGenerator.hpp"

#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace ordering::application {

/**
 * @brief Обработчики команд над заказом
 *
 * Шаги каждой команды:
 * 1. Если есть requestId и он уже обработан этой же командой, вернуть
 *    сохранённый ответ (replayed). Ключ, записанный другой командой,
 *    отклоняется как VALIDATION.
 * 2. Проверить вход до любых изменений.
 * 3. Взять мьютекс заказа, открыть unit of work, повторно проверить requestId,
 *    загрузить заказ (или создать новый).
 * 4. Вызвать ровно один метод агрегата. DomainError -> rollback и ответ с ошибкой.
 * 5. Сохранить заказ, затем доменные события -> строки outbox и отметка
 *    идемпотентности, commit.
 * 6. ConcurrencyException -> rollback и повтор (до maxRetries), затем
 *    CONCURRENCY_CONFLICT.
 * 7. После commit уведомить relay.
 *
 * Отказ до commit не оставляет следов: ни заказа, ни строк outbox.
 */
class OrderCommandService : public ports::input::IOrderCommandService {
public:
    using CommitListener = std::function<void()>;

    OrderCommandService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWorkFactory,
        std::shared_ptr<ports::output::IIdempotencyRepository> idempotencyRepository,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        std::shared_ptr<settings::ICommandSettings> settings
    ) : unitOfWorkFactory_(std::move(unitOfWorkFactory))
      , idempotencyRepository_(std::move(idempotencyRepository))
      , clock_(std::move(clock))
      , metrics_(std::move(metrics))
      , maxRetries_(settings->getMaxRetries())
    {
        std::cout << "[OrderCommandService] Created (maxRetries=" << maxRetries_ << ")" << std::endl;
    }

    /**
     * @brief Вызывается после каждого успешного commit (будит OutboxRelay)
     */
    void setCommitListener(CommitListener listener) {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        commitListener_ = std::move(listener);
    }

    domain::CommandResult createOrder(const domain::CreateOrderCommand& command) override {
        static const std::string name = "create_order";
        metrics_->increment("commands_total", {{"command", name}});

        if (command.requestId.empty()) {
            return reject(name, "", domain::DomainError::validation("createOrder", "requestId is required"));
        }
        if (auto stored = findReplay(name, command.requestId)) {
            return *stored;
        }
        if (auto error = validate(command)) {
            return reject(name, "", *error);
        }

        std::string orderId = utils::UuidGenerator::generateWithPrefix("ord");

        // Новый заказ ещё никому не виден, поэтому сериализуем по requestId
        return execute(name, "req:" + command.requestId, orderId, command.requestId,
            [&](ports::output::IUnitOfWork&) -> Outcome {
                domain::Order order(
                    orderId, command.buyerId, command.buyerName, command.address,
                    domain::PaymentCard(command.card.cardType, command.card.cardNumber,
                                        command.card.holderName, command.card.expiration),
                    clock_->now());

                for (const auto& item : command.items) {
                    if (auto error = order.addOrderItem(item.productId, item.productName, item.unitPrice,
                                                        item.discount, item.pictureUrl, item.units)) {
                        return *error;
                    }
                }
                return order;
            });
    }

    domain::CommandResult confirmGracePeriod(const domain::SetAwaitingValidationCommand& command) override {
        return transition("confirm_grace_period", "setAwaitingValidationStatus",
                          command.orderId, command.requestId,
                          [](domain::Order& order) { return order.setAwaitingValidationStatus(); });
    }

    domain::CommandResult confirmStock(const domain::ConfirmStockCommand& command) override {
        if (command.rejectedProductIds.empty()) {
            return transition("confirm_stock", "setStockConfirmedStatus",
                              command.orderId, command.requestId,
                              [](domain::Order& order) { return order.setStockConfirmedStatus(); });
        }
        const auto& rejected = command.rejectedProductIds;
        return transition("confirm_stock", "setStockRejectedStatus",
                          command.orderId, command.requestId,
                          [&rejected](domain::Order& order) { return order.setStockRejectedStatus(rejected); });
    }

    domain::CommandResult markPaid(const domain::MarkPaidCommand& command) override {
        return transition("mark_paid", "setPaidStatus", command.orderId, command.requestId,
                          [](domain::Order& order) { return order.setPaidStatus(); });
    }

    domain::CommandResult markShipped(const domain::MarkShippedCommand& command) override {
        return transition("mark_shipped", "setShippedStatus", command.orderId, command.requestId,
                          [](domain::Order& order) { return order.setShippedStatus(); });
    }

    domain::CommandResult cancelOrder(const domain::CancelOrderCommand& command) override {
        return transition("cancel_order", "setCancelledStatus", command.orderId, command.requestId,
                          [](domain::Order& order) { return order.setCancelledStatus(); });
    }

private:
    using Outcome = std::variant<domain::Order, domain::DomainError>;
    using Mutation = std::function<Outcome(ports::output::IUnitOfWork&)>;
    using AggregateCall = std::function<std::optional<domain::DomainError>(domain::Order&)>;

    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWorkFactory_;
    std::shared_ptr<ports::output::IIdempotencyRepository> idempotencyRepository_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    int maxRetries_;

    OrderLockRegistry locks_;
    std::mutex listenerMutex_;
    CommitListener commitListener_;

    /**
     * @brief Команда над существующим заказом: load -> один метод агрегата
     */
    domain::CommandResult transition(const std::string& name, const std::string& transitionName,
                                     const std::string& orderId, const std::string& requestId,
                                     const AggregateCall& call) {
        metrics_->increment("commands_total", {{"command", name}});

        if (orderId.empty()) {
            return reject(name, orderId, domain::DomainError::validation(transitionName, "orderId is required"));
        }
        if (auto stored = findReplay(name, requestId)) {
            return *stored;
        }

        return execute(name, orderId, orderId, requestId,
            [&](ports::output::IUnitOfWork& unit) -> Outcome {
                auto order = unit.loadOrder(orderId);
                if (!order) {
                    return domain::DomainError::notFound(transitionName, orderId);
                }
                if (auto error = call(*order)) {
                    return *error;
                }
                return std::move(*order);
            });
    }

    domain::CommandResult execute(const std::string& name, const std::string& lockKey,
                                  const std::string& orderId, const std::string& requestId,
                                  const Mutation& mutation) {
        auto guard = locks_.acquire(lockKey);

        for (int attempt = 1; ; ++attempt) {
            try {
                auto unit = unitOfWorkFactory_->begin();

                if (!requestId.empty()) {
                    if (auto processed = unit->findProcessed(requestId)) {
                        unit->rollback();
                        return replay(name, *processed);
                    }
                }

                Outcome outcome = mutation(*unit);
                if (auto* error = std::get_if<domain::DomainError>(&outcome)) {
                    unit->rollback();
                    return reject(name, orderId, *error);
                }

                auto& order = std::get<domain::Order>(outcome);
                auto now = clock_->now();
                auto events = order.pullDomainEvents();

                unit->saveOrder(order);
                for (const auto& event : events) {
                    unit->addOutboxRecord(
                        IntegrationEventMapper::toOutboxRecord(IntegrationEventMapper::map(event, now)));
                }

                auto result = domain::CommandResult::ok(order.getId(), order.getStatus());
                if (!requestId.empty()) {
                    unit->markProcessed(domain::IdempotencyRecord{
                        requestId, name, order.getId(), result.toJson(), now});
                }
                unit->commit();

                std::cout << "[OrderCommandService] " << name << " order=" << order.getId()
                          << " status=" << domain::toString(order.getStatus()) << std::endl;

                notifyCommitted();
                return result;
            } catch (const ports::output::ConcurrencyException& e) {
                if (attempt > maxRetries_) {
                    std::cerr << "[OrderCommandService] " << name << " order=" << orderId
                              << " gave up after " << attempt << " attempts: " << e.what() << std::endl;
                    return reject(name, orderId, domain::DomainError::conflict(name, e.what()));
                }
                std::cout << "[OrderCommandService] " << name << " order=" << orderId
                          << " conflict, retry " << attempt << "/" << maxRetries_ << std::endl;
            }
        }
    }

    std::optional<domain::CommandResult> findReplay(const std::string& name, const std::string& requestId) {
        if (requestId.empty()) {
            return std::nullopt;
        }
        auto processed = idempotencyRepository_->find(requestId);
        if (!processed) {
            return std::nullopt;
        }
        return replay(name, *processed);
    }

    domain::CommandResult replay(const std::string& name, const domain::IdempotencyRecord& record) {
        if (record.commandName != name) {
            return reject(name, record.orderId, domain::DomainError::validation(
                name, "requestId " + record.key + " was already used by " + record.commandName));
        }

        metrics_->increment("commands_replayed_total");
        std::cout << "[OrderCommandService] Replay " << record.commandName
                  << " requestId=" << record.key << " order=" << record.orderId << std::endl;

        auto result = domain::CommandResult::fromJson(record.body);
        result.replayed = true;
        return result;
    }

    domain::CommandResult reject(const std::string& name, const std::string& orderId,
                                 const domain::DomainError& error) {
        metrics_->increment("command_errors_total", {{"kind", domain::toString(error.kind)}});
        std::cout << "[OrderCommandService] " << name << " rejected ("
                  << domain::toString(error.kind) << "): " << error.message << std::endl;
        return domain::CommandResult::fail(orderId, error);
    }

    static std::optional<domain::DomainError> validate(const domain::CreateOrderCommand& command) {
        static const std::string operation = "createOrder";

        if (command.buyerId.empty()) {
            return domain::DomainError::validation(operation, "buyerId is required");
        }
        if (auto missing = command.address.findMissingField()) {
            return domain::DomainError::validation(operation, "Address field is required: " + *missing);
        }
        domain::PaymentCard card(command.card.cardType, command.card.cardNumber,
                                 command.card.holderName, command.card.expiration);
        if (auto missing = card.findMissingField()) {
            return domain::DomainError::validation(operation, "Card field is required: " + *missing);
        }
        if (command.items.empty()) {
            return domain::DomainError::validation(operation, "Order must contain at least one item");
        }
        return std::nullopt;
    }

    void notifyCommitted() {
        CommitListener listener;
        {
            std::lock_guard<std::mutex> lock(listenerMutex_);
            listener = commitListener_;
        }
        if (listener) {
            listener();
        }
    }
};

} // namespace ordering::application
