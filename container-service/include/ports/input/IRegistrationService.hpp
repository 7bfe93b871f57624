#pragma once

#include "domain/RegistrationChallenge.hpp"
#include "domain/enums/RegistrationState.hpp"
#include <string>
#include <optional>

namespace containers::ports::input {

/**
 * @brief Регистрация устройства (QR код / URL) для контейнера
 *
 * Unregistered -> Pending -> Registered, Pending -> Expired по TTL.
 */
class IRegistrationService {
public:
    virtual ~IRegistrationService() = default;

    /**
     * @brief Выпустить одноразовый challenge и URL для QR кода
     *
     * Повторный вызов для Registered начинает перерегистрацию
     * и сбрасывает текущую привязку устройства.
     *
     * @throws ContainerError UNSUPPORTED_ACTION если тип контейнера не поддерживает
     *         регистрацию, REGISTRATION_PENDING если живой challenge ещё не использовался
     */
    virtual domain::RegistrationOffer beginRegistration(
        const std::string& serial,
        const std::optional<std::string>& passphrasePrompt,
        const std::optional<std::string>& passphrase
    ) = 0;

    /**
     * @brief Завершить регистрацию ответом устройства
     * @throws ContainerError INVALID_OR_EXPIRED_CHALLENGE
     */
    virtual void completeRegistration(
        const std::string& serial,
        const std::string& nonce,
        const std::optional<std::string>& passphrase,
        const domain::DeviceInfo& device
    ) = 0;

    /**
     * @brief Сбросить регистрацию в Unregistered
     */
    virtual void terminateRegistration(const std::string& serial) = 0;

    virtual domain::RegistrationState getRegistrationState(const std::string& serial) = 0;
};

} // namespace containers::ports::input
