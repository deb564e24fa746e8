#pragma once

#include <string>
#include <vector>

namespace ordering::settings {

/**
 * @brief Определение метрики для Prometheus
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "commands_total")
    std::string help;   ///< Описание для HELP
    std::string type;   ///< Тип метрики: "counter"
};

/**
 * @brief Интерфейс настроек метрик
 *
 * Все ключи объявляются заранее: MetricsService инициализирует их нулями
 * и выводит в этом порядке.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /**
     * @return ключи в формате "metric_name{label=\"value\"}"
     */
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace ordering::settings
