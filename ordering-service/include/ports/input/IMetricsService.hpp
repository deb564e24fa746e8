#pragma once

#include <string>
#include <map>
#include <cstdint>

namespace ordering::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Только counter-метрики с опциональными labels, вывод в формате Prometheus.
 *
 * @example
 * ```cpp
 * metricsService->increment("commands_total", {{"command", "create_order"}});
 * metricsService->increment("outbox_published_total");
 * std::string output = metricsService->toPrometheusFormat();
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Увеличить счётчик на 1
     *
     * Ключ формируется как name{label1="value1",label2="value2"}.
     * Неизвестный ключ создаётся со значением 1.
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Текущее значение счётчика (0, если ключа нет)
     */
    virtual int64_t value(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) const = 0;

    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace ordering::ports::input
