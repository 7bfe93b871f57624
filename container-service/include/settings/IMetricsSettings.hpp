#pragma once

#include <string>
#include <vector>

namespace containers::settings {

/**
 * @brief Определение метрики для Prometheus
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "http_requests_total")
    std::string help;   ///< Описание метрики для HELP
    std::string type;   ///< Тип метрики: "counter", "gauge", "histogram"
};

/**
 * @brief Интерфейс настроек метрик
 *
 * Все ключи метрик перечислены заранее: они инициализируются нулями
 * и задают порядок вывода в Prometheus формате.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    /**
     * @brief Определения метрик для HELP и TYPE
     */
    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /**
     * @brief Все ключи в формате "metric_name{label1=\"value1\"}"
     */
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace containers::settings
