#pragma once

#include "domain/Order.hpp"
#include "domain/OutboxRecord.hpp"
#include "domain/IdempotencyRecord.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace ordering::ports::output {

/**
 * @brief Конфликт параллельной записи
 *
 * Версия заказа изменилась после чтения, либо ключ идемпотентности уже
 * записан другой транзакцией. Обработчик команды откатывает unit of work
 * и повторяет попытку.
 */
class ConcurrencyException : public std::runtime_error {
public:
    explicit ConcurrencyException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Одна атомарная единица записи
 *
 * Изменение заказа, строки outbox и отметка идемпотентности становятся
 * видимы вместе в commit(), либо не становятся видимы вовсе.
 * Незакоммиченный unit of work откатывается в деструкторе.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual std::optional<domain::IdempotencyRecord> findProcessed(const std::string& key) = 0;

    /**
     * @brief Загрузить заказ и заблокировать его до конца unit of work
     */
    virtual std::optional<domain::Order> loadOrder(const std::string& orderId) = 0;

    /**
     * @brief Вставить (version == 0) или обновить заказ с проверкой версии
     * @throws ConcurrencyException при несовпадении версии
     */
    virtual void saveOrder(const domain::Order& order) = 0;

    virtual void addOutboxRecord(const domain::OutboxRecord& record) = 0;

    virtual void markProcessed(const domain::IdempotencyRecord& record) = 0;

    /**
     * @throws ConcurrencyException при конфликте, std::exception при сбое хранилища
     */
    virtual void commit() = 0;

    virtual void rollback() = 0;
};

class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;
    virtual std::unique_ptr<IUnitOfWork> begin() = 0;
};

} // namespace ordering::ports::output
