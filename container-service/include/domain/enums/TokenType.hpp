#pragma once

#include <string>
#include <vector>
#include <optional>

namespace containers::domain {

/**
 * @brief Тип OTP токена
 *
 * Криптография токенов живёт в отдельной подсистеме,
 * здесь важен только тип для шаблонов и совместимости с контейнером.
 */
enum class TokenType {
    HOTP,
    TOTP,
    PUSH,
    DAYPASSWORD,
    SMS,
    SPASS,
    CERTIFICATE,
    WEBAUTHN,
    PASSKEY,
    YUBIKEY
};

inline std::string toString(TokenType type) {
    switch (type) {
        case TokenType::HOTP:        return "hotp";
        case TokenType::TOTP:        return "totp";
        case TokenType::PUSH:        return "push";
        case TokenType::DAYPASSWORD: return "daypassword";
        case TokenType::SMS:         return "sms";
        case TokenType::SPASS:       return "spass";
        case TokenType::CERTIFICATE: return "certificate";
        case TokenType::WEBAUTHN:    return "webauthn";
        case TokenType::PASSKEY:     return "passkey";
        case TokenType::YUBIKEY:     return "yubikey";
    }
    return "unknown";
}

inline std::optional<TokenType> tokenTypeFromString(const std::string& str) {
    if (str == "hotp")        return TokenType::HOTP;
    if (str == "totp")        return TokenType::TOTP;
    if (str == "push")        return TokenType::PUSH;
    if (str == "daypassword") return TokenType::DAYPASSWORD;
    if (str == "sms")         return TokenType::SMS;
    if (str == "spass")       return TokenType::SPASS;
    if (str == "certificate") return TokenType::CERTIFICATE;
    if (str == "webauthn")    return TokenType::WEBAUTHN;
    if (str == "passkey")     return TokenType::PASSKEY;
    if (str == "yubikey")     return TokenType::YUBIKEY;
    return std::nullopt;
}

inline std::vector<TokenType> allTokenTypes() {
    return {TokenType::HOTP, TokenType::TOTP, TokenType::PUSH, TokenType::DAYPASSWORD,
            TokenType::SMS, TokenType::SPASS, TokenType::CERTIFICATE, TokenType::WEBAUTHN,
            TokenType::PASSKEY, TokenType::YUBIKEY};
}

/**
 * @brief Префикс серийного номера токена
 */
inline std::string serialPrefix(TokenType type) {
    switch (type) {
        case TokenType::HOTP:        return "OATH";
        case TokenType::TOTP:        return "TOTP";
        case TokenType::PUSH:        return "PIPU";
        case TokenType::DAYPASSWORD: return "DAYP";
        case TokenType::SMS:         return "PISM";
        case TokenType::SPASS:       return "PISP";
        case TokenType::CERTIFICATE: return "CRT";
        case TokenType::WEBAUTHN:    return "WAN";
        case TokenType::PASSKEY:     return "PIPK";
        case TokenType::YUBIKEY:     return "UBAM";
    }
    return "TOKN";
}

} // namespace containers::domain
