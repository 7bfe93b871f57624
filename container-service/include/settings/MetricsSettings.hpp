#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace containers::settings {

/**
 * @brief Настройки метрик для Container Service
 *
 * HTTP метрики перечислены по нормализованным путям
 * (serial и имена шаблонов заменены на {serial} / {name}).
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"containers_created_total", "Total containers created by type", "counter"},
            {"containers_deleted_total", "Total containers deleted", "counter"},
            {"tokens_provisioned_total", "Total tokens provisioned", "counter"},
            {"provisioning_failures_total", "Total failed token provisioning attempts", "counter"},
            {"registrations_started_total", "Total registrations started", "counter"},
            {"registrations_completed_total", "Total registrations completed", "counter"},
            {"registrations_failed_total", "Total failed registration completions", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            // ============================================
            // HTTP метрики (method + path)
            // ============================================

            // Health & Metrics
            "http_requests_total{method=\"GET\",path=\"/health\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\"}",

            // Containers
            "http_requests_total{method=\"GET\",path=\"/container\"}",
            "http_requests_total{method=\"POST\",path=\"/container/init\"}",
            "http_requests_total{method=\"GET\",path=\"/container/{serial}\"}",
            "http_requests_total{method=\"POST\",path=\"/container/{serial}\"}",
            "http_requests_total{method=\"DELETE\",path=\"/container/{serial}\"}",

            // Templates
            "http_requests_total{method=\"GET\",path=\"/container/templates\"}",
            "http_requests_total{method=\"POST\",path=\"/container/templates\"}",
            "http_requests_total{method=\"DELETE\",path=\"/container/templates\"}",

            // Registration
            "http_requests_total{method=\"GET\",path=\"/container/register\"}",
            "http_requests_total{method=\"POST\",path=\"/container/register\"}",

            // Tokens
            "http_requests_total{method=\"GET\",path=\"/token\"}",
            "http_requests_total{method=\"POST\",path=\"/token\"}",
            "http_requests_total{method=\"DELETE\",path=\"/token\"}",

            // ============================================
            // Бизнес метрики
            // ============================================
            "containers_created_total{type=\"generic\"}",
            "containers_created_total{type=\"smartphone\"}",
            "containers_created_total{type=\"smartcard\"}",
            "containers_deleted_total",
            "tokens_provisioned_total",
            "provisioning_failures_total",
            "registrations_started_total",
            "registrations_completed_total",
            "registrations_failed_total"
        };
    }
};

} // namespace containers::settings
