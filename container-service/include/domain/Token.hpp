#pragma once

#include "enums/TokenType.hpp"
#include "Owner.hpp"
#include "Timestamp.hpp"
#include <string>
#include <map>
#include <optional>

namespace containers::domain {

/**
 * @brief OTP токен в реестре
 *
 * Привязка к контейнеру хранится на стороне токена,
 * поэтому токен физически не может состоять в двух контейнерах.
 */
struct Token {
    std::string serial;                         ///< Уникальный, неизменяемый
    TokenType type = TokenType::HOTP;
    bool active = true;
    std::optional<Owner> owner;
    std::optional<std::string> containerSerial; ///< Контейнер, в котором лежит токен
    Timestamp boundAt;                          ///< Время привязки (порядок в контейнере)
    std::string description;
    std::map<std::string, std::string> info;    ///< Настройки provisioning
    Timestamp createdAt;

    Token() = default;

    Token(const std::string& serial, TokenType type)
        : serial(serial), type(type), createdAt(Timestamp::now()) {}

    bool isBound() const { return containerSerial.has_value(); }
};

} // namespace containers::domain
