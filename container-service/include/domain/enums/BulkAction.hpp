#pragma once

#include <string>
#include <optional>

namespace containers::domain {

/**
 * @brief Действие над всеми токенами контейнера
 */
enum class BulkAction {
    ACTIVATE,
    DEACTIVATE,
    REMOVE
};

inline std::string toString(BulkAction action) {
    switch (action) {
        case BulkAction::ACTIVATE:   return "activate";
        case BulkAction::DEACTIVATE: return "deactivate";
        case BulkAction::REMOVE:     return "remove";
    }
    return "unknown";
}

inline std::optional<BulkAction> bulkActionFromString(const std::string& str) {
    if (str == "activate")   return BulkAction::ACTIVATE;
    if (str == "deactivate") return BulkAction::DEACTIVATE;
    if (str == "remove")     return BulkAction::REMOVE;
    return std::nullopt;
}

} // namespace containers::domain
