#pragma once

#include <stdexcept>
#include <string>

namespace containers::domain {

/**
 * @brief Коды доменных ошибок
 */
enum class ErrorCode {
    NOT_FOUND,
    TYPE_MISMATCH,
    DUPLICATE_NAME,
    OWNERSHIP_CONFLICT,
    HAS_BOUND_TOKENS,
    INVALID_OR_EXPIRED_CHALLENGE,
    PROVISIONING_ERROR,
    UNSUPPORTED_ACTION,
    INVALID_PARAMETER,
    TEMPLATE_IN_USE,
    REGISTRATION_PENDING
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND:                    return "NOT_FOUND";
        case ErrorCode::TYPE_MISMATCH:                return "TYPE_MISMATCH";
        case ErrorCode::DUPLICATE_NAME:               return "DUPLICATE_NAME";
        case ErrorCode::OWNERSHIP_CONFLICT:           return "OWNERSHIP_CONFLICT";
        case ErrorCode::HAS_BOUND_TOKENS:             return "HAS_BOUND_TOKENS";
        case ErrorCode::INVALID_OR_EXPIRED_CHALLENGE: return "INVALID_OR_EXPIRED_CHALLENGE";
        case ErrorCode::PROVISIONING_ERROR:           return "PROVISIONING_ERROR";
        case ErrorCode::UNSUPPORTED_ACTION:           return "UNSUPPORTED_ACTION";
        case ErrorCode::INVALID_PARAMETER:            return "INVALID_PARAMETER";
        case ErrorCode::TEMPLATE_IN_USE:              return "TEMPLATE_IN_USE";
        case ErrorCode::REGISTRATION_PENDING:         return "REGISTRATION_PENDING";
    }
    return "UNKNOWN";
}

/**
 * @brief Доменная ошибка операций с контейнерами
 *
 * Всё, что не ContainerError (например, ошибки pqxx),
 * считается сбоем инфраструктуры.
 */
class ContainerError : public std::runtime_error {
public:
    ContainerError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

    static ContainerError notFound(const std::string& what) {
        return ContainerError(ErrorCode::NOT_FOUND, what + " not found");
    }

private:
    ErrorCode code_;
};

} // namespace containers::domain
