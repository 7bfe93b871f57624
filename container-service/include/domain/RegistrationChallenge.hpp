#pragma once

#include "Timestamp.hpp"
#include "enums/RegistrationState.hpp"
#include <string>
#include <optional>
#include <chrono>

namespace containers::domain {

/**
 * @brief Одноразовый секрет привязки устройства
 *
 * Живёт до успешной регистрации или истечения TTL.
 */
struct RegistrationChallenge {
    std::string containerSerial;
    std::string nonce;
    Timestamp issuedAt;
    Timestamp expiresAt;
    std::string passphrasePrompt;
    std::string passphraseHash;   ///< SHA-256 hex, пусто если пароль не нужен
    int failedAttempts = 0;

    bool requiresPassphrase() const { return !passphraseHash.empty(); }

    bool isExpired(const Timestamp& now, std::chrono::seconds grace) const {
        return expiresAt.plus(grace) < now;
    }
};

/**
 * @brief Фактическое состояние регистрации на момент now
 *
 * Pending без живого challenge читается как Expired.
 * Фонового таймера нет, истечение вычисляется при чтении.
 */
inline RegistrationState effectiveRegistrationState(
    RegistrationState stored,
    const std::optional<RegistrationChallenge>& challenge,
    const Timestamp& now,
    std::chrono::seconds grace)
{
    if (stored != RegistrationState::PENDING) {
        return stored;
    }
    if (!challenge || challenge->isExpired(now, grace)) {
        return RegistrationState::EXPIRED;
    }
    return RegistrationState::PENDING;
}

/**
 * @brief Данные для QR-кода, выдаваемые администратору
 */
struct RegistrationOffer {
    std::string containerSerial;
    std::string url;              ///< pia://container/... (содержимое QR)
    std::string nonce;
    std::string timeStamp;
    int ttlMinutes = 0;
    std::string keyAlgorithm;
    std::string hashAlgorithm;
    bool sslVerify = true;
    std::string passphrasePrompt;
    std::string serverUrl;
};

/**
 * @brief Ответ устройства при завершении регистрации
 */
struct DeviceInfo {
    std::string brand;
    std::string model;
    std::string publicKey;
};

} // namespace containers::domain
