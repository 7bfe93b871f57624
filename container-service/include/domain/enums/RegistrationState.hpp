#pragma once

#include <string>

namespace containers::domain {

/**
 * @brief Состояние привязки физического устройства к контейнеру
 *
 * Unregistered -> Pending -> Registered, Pending -> Expired по истечении TTL.
 */
enum class RegistrationState {
    UNREGISTERED,
    PENDING,
    REGISTERED,
    EXPIRED
};

inline std::string toString(RegistrationState state) {
    switch (state) {
        case RegistrationState::UNREGISTERED: return "unregistered";
        case RegistrationState::PENDING:      return "pending";
        case RegistrationState::REGISTERED:   return "registered";
        case RegistrationState::EXPIRED:      return "expired";
    }
    return "unknown";
}

inline RegistrationState registrationStateFromString(const std::string& str) {
    if (str == "pending")    return RegistrationState::PENDING;
    if (str == "registered") return RegistrationState::REGISTERED;
    if (str == "expired")    return RegistrationState::EXPIRED;
    return RegistrationState::UNREGISTERED;
}

} // namespace containers::domain
