#pragma once

#include <string>
#include <map>

namespace containers::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Только counter метрики с опциональными labels.
 *
 * @example
 * ```cpp
 * metricsService->increment("containers_created_total");
 * metricsService->increment("http_requests_total", {
 *     {"method", "POST"},
 *     {"path", "/container/init"}
 * });
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Инкрементировать счётчик метрики
     *
     * Ключ метрики формируется как "name{label1=\"value1\",label2=\"value2\"}".
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Сериализовать метрики в Prometheus text format 0.0.4
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace containers::ports::input
