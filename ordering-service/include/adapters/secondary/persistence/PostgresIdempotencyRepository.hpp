#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/secondary/persistence/PostgresRowMapper.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace ordering::adapters::secondary
{

    class PostgresIdempotencyRepository : public ports::output::IIdempotencyRepository
    {
    public:
        explicit PostgresIdempotencyRepository(std::shared_ptr<settings::DbSettings> s) : settings_(std::move(s)) {}

        std::optional<domain::IdempotencyRecord> find(const std::string &key) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::read_transaction t(c);
            auto r = t.exec_params(
                "SELECT key, command_name, order_id, response_body, "
                "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms "
                "FROM processed_commands WHERE key=$1",
                key);
            if (r.empty())
                return std::nullopt;
            return postgres::rowToIdempotencyRecord(r[0]);
        }

    private:
        std::shared_ptr<settings::DbSettings> settings_;
    };

} // namespace ordering::adapters::secondary
