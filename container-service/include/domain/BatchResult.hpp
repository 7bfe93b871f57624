#pragma once

#include <string>
#include <vector>
#include <algorithm>

namespace containers::domain {

/**
 * @brief Результат операции над одним элементом пакета
 */
struct ItemResult {
    std::string serial;
    bool success = false;
    std::string message;
};

/**
 * @brief Результат пакетной операции
 *
 * Пакет не прерывается на первой ошибке: вызывающий
 * должен смотреть на items, а не только на общий статус.
 */
struct BatchResult {
    std::vector<ItemResult> items;
    std::string note;

    void succeed(const std::string& serial, const std::string& message = "") {
        items.push_back({serial, true, message});
    }

    void fail(const std::string& serial, const std::string& message) {
        items.push_back({serial, false, message});
    }

    size_t failures() const {
        return static_cast<size_t>(std::count_if(items.begin(), items.end(),
            [](const ItemResult& r) { return !r.success; }));
    }

    bool allSucceeded() const { return failures() == 0; }
};

} // namespace containers::domain
