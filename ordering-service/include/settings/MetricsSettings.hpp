#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace ordering::settings {

/**
 * @brief Метрики Ordering Service
 *
 * - команды (по типу, ошибки по виду, повторы по ключу идемпотентности)
 * - outbox relay
 * - входящие события из RabbitMQ
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"commands_total", "Total commands handled", "counter"},
            {"command_errors_total", "Commands rejected with a domain error", "counter"},
            {"commands_replayed_total", "Commands answered from the idempotency log", "counter"},
            {"outbox_published_total", "Outbox rows confirmed by the broker", "counter"},
            {"outbox_failed_total", "Outbox publish attempts that failed", "counter"},
            {"outbox_exhausted_total", "Outbox rows that ran out of attempts", "counter"},
            {"outbox_timeouts_total", "Outbox publishes without a confirm", "counter"},
            {"outbox_unavailable_total", "Relay cycles stopped because the broker was unreachable", "counter"},
            {"events_received_total", "Total events received from RabbitMQ", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            // Команды
            "commands_total{command=\"create_order\"}",
            "commands_total{command=\"confirm_grace_period\"}",
            "commands_total{command=\"confirm_stock\"}",
            "commands_total{command=\"mark_paid\"}",
            "commands_total{command=\"mark_shipped\"}",
            "commands_total{command=\"cancel_order\"}",

            "command_errors_total{kind=\"VALIDATION\"}",
            "command_errors_total{kind=\"INVALID_TRANSITION\"}",
            "command_errors_total{kind=\"CONCURRENCY_CONFLICT\"}",
            "command_errors_total{kind=\"NOT_FOUND\"}",

            "commands_replayed_total",

            // Outbox
            "outbox_published_total",
            "outbox_failed_total",
            "outbox_exhausted_total",
            "outbox_timeouts_total",
            "outbox_unavailable_total",

            // Входящие события (routing key)
            "events_received_total{event=\"grace_period.confirmed\"}",
            "events_received_total{event=\"stock.confirmed\"}",
            "events_received_total{event=\"stock.rejected\"}",
            "events_received_total{event=\"payment.succeeded\"}",
            "events_received_total{event=\"payment.failed\"}"
        };
    }
};

} // namespace ordering::settings
