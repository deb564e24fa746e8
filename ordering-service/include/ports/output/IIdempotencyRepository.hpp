#pragma once

#include "domain/IdempotencyRecord.hpp"
#include <string>
#include <optional>

namespace ordering::ports::output {

/**
 * @brief Журнал обработанных команд (только чтение)
 *
 * Запись выполняется внутри IUnitOfWork вместе с изменением заказа.
 */
class IIdempotencyRepository {
public:
    virtual ~IIdempotencyRepository() = default;
    virtual std::optional<domain::IdempotencyRecord> find(const std::string& key) = 0;
};

} // namespace ordering::ports::output
