#pragma once

#include <string>
#include <optional>

namespace containers::domain {

/**
 * @brief Рабочее состояние контейнера
 *
 * "active" и "disabled" взаимоисключающие, переключаются парой.
 */
enum class OperationalState {
    ACTIVE,
    DISABLED
};

/**
 * @brief Независимые отметки о состоянии носителя
 */
enum class ConditionMarker {
    LOST,
    DAMAGED
};

inline std::string toString(OperationalState state) {
    switch (state) {
        case OperationalState::ACTIVE:   return "active";
        case OperationalState::DISABLED: return "disabled";
    }
    return "unknown";
}

inline std::string toString(ConditionMarker marker) {
    switch (marker) {
        case ConditionMarker::LOST:    return "lost";
        case ConditionMarker::DAMAGED: return "damaged";
    }
    return "unknown";
}

inline std::optional<OperationalState> operationalStateFromString(const std::string& str) {
    if (str == "active")   return OperationalState::ACTIVE;
    if (str == "disabled") return OperationalState::DISABLED;
    return std::nullopt;
}

inline std::optional<ConditionMarker> conditionMarkerFromString(const std::string& str) {
    if (str == "lost")    return ConditionMarker::LOST;
    if (str == "damaged") return ConditionMarker::DAMAGED;
    return std::nullopt;
}

} // namespace containers::domain
