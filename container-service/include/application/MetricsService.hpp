#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <memory>
#include <string>
#include <sstream>
#include <map>
#include <set>
#include <unordered_map>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <iostream>

namespace containers::application {

/**
 * @brief Сервис сбора и хранения метрик
 *
 * - Потокобезопасность через shared_mutex (read) / unique_lock (write)
 * - Атомарные счётчики для lock-free инкремента
 * - Ключи из настроек выводятся первыми, в их порядке; остальные следом
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getAllKeys()) {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(0);
        }

        std::cout << "[MetricsService] Initialized with "
                  << counters_.size() << " metrics" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        std::string key = buildKey(name, labels);

        // Fast path: ключ уже существует
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(key);
        if (it != counters_.end()) {
            it->second->fetch_add(1, std::memory_order_relaxed);
        } else {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(1);
        }
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream oss;

        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";
        }

        auto declared = settings_->getAllKeys();
        std::set<std::string> declaredSet(declared.begin(), declared.end());

        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& key : declared) {
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                oss << key << " " << it->second->load(std::memory_order_relaxed) << "\n";
            }
        }

        // Ключи, появившиеся в runtime (например, неизвестный путь), в алфавитном порядке
        std::map<std::string, int64_t> extra;
        for (const auto& [key, counter] : counters_) {
            if (declaredSet.count(key) == 0) {
                extra[key] = counter->load(std::memory_order_relaxed);
            }
        }
        for (const auto& [key, value] : extra) {
            oss << key << " " << value << "\n";
        }

        return oss.str();
    }

    /**
     * @brief Текущее значение счётчика (0 если его нет)
     */
    int64_t get(const std::string& name, const std::map<std::string, std::string>& labels = {}) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(buildKey(name, labels));
        return it != counters_.end() ? it->second->load(std::memory_order_relaxed) : 0;
    }

    /**
     * @brief Сумма счётчика по всем значениям labels
     */
    int64_t total(const std::string& name) const {
        int64_t sum = 0;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [key, counter] : counters_) {
            if (key == name || key.compare(0, name.size() + 1, name + "{") == 0) {
                sum += counter->load(std::memory_order_relaxed);
            }
        }
        return sum;
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::atomic<int64_t>>> counters_;

    std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels
    ) const {
        if (labels.empty()) {
            return name;
        }

        std::ostringstream oss;
        oss << name << "{";
        bool first = true;
        for (const auto& [k, v] : labels) {
            if (!first) oss << ",";
            oss << k << "=\"" << v << "\"";
            first = false;
        }
        oss << "}";
        return oss.str();
    }
};

} // namespace containers::application
