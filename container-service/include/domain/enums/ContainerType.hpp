#pragma once

#include "TokenType.hpp"
#include <string>
#include <vector>
#include <optional>
#include <algorithm>

namespace containers::domain {

/**
 * @brief Тип контейнера
 */
enum class ContainerType {
    GENERIC,     ///< Универсальный контейнер, любые токены
    SMARTPHONE,  ///< Смартфон с authenticator-приложением
    SMARTCARD    ///< Смарт-карта / аппаратный ключ
};

inline std::string toString(ContainerType type) {
    switch (type) {
        case ContainerType::GENERIC:    return "generic";
        case ContainerType::SMARTPHONE: return "smartphone";
        case ContainerType::SMARTCARD:  return "smartcard";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 * @return nullopt если тип не известен
 */
inline std::optional<ContainerType> containerTypeFromString(const std::string& str) {
    if (str == "generic")    return ContainerType::GENERIC;
    if (str == "smartphone") return ContainerType::SMARTPHONE;
    if (str == "smartcard")  return ContainerType::SMARTCARD;
    return std::nullopt;
}

/**
 * @brief Префикс серийного номера контейнера
 */
inline std::string serialPrefix(ContainerType type) {
    switch (type) {
        case ContainerType::GENERIC:    return "CONT";
        case ContainerType::SMARTPHONE: return "SMPH";
        case ContainerType::SMARTCARD:  return "SMRC";
    }
    return "CONT";
}

/**
 * @brief Типы токенов, которые может содержать контейнер
 */
inline std::vector<TokenType> supportedTokenTypes(ContainerType type) {
    switch (type) {
        case ContainerType::SMARTPHONE:
            return {TokenType::HOTP, TokenType::TOTP, TokenType::PUSH,
                    TokenType::DAYPASSWORD, TokenType::SMS};
        case ContainerType::SMARTCARD:
            return {TokenType::HOTP, TokenType::TOTP, TokenType::CERTIFICATE,
                    TokenType::WEBAUTHN, TokenType::PASSKEY, TokenType::YUBIKEY};
        case ContainerType::GENERIC:
            break;
    }
    return allTokenTypes();
}

inline bool supportsTokenType(ContainerType containerType, TokenType tokenType) {
    auto supported = supportedTokenTypes(containerType);
    return std::find(supported.begin(), supported.end(), tokenType) != supported.end();
}

/**
 * @brief Поддерживает ли тип регистрацию физического устройства (QR pairing)
 */
inline bool supportsRegistration(ContainerType type) {
    return type == ContainerType::SMARTPHONE;
}

} // namespace containers::domain
