#pragma once

#include "ports/input/IRegistrationService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IContainerRepository.hpp"
#include "ports/output/IChallengeRepository.hpp"
#include "ports/output/IClock.hpp"
#include "settings/RegistrationSettings.hpp"
#include "application/EntityLockManager.hpp"
#include "domain/ContainerError.hpp"
#include "utils/CryptoUtils.hpp"
#include "utils/StringUtils.hpp"

#include <memory>
#include <iostream>

namespace containers::application {

/**
 * @brief Регистрация устройства для контейнера
 *
 * Challenge одноразовый: удаляется при успехе и заменяется
 * при новом beginRegistration. Истечение проверяется лениво
 * (expiresAt + grace против текущего времени IClock).
 *
 * Любая ошибка завершения отдаётся как INVALID_OR_EXPIRED_CHALLENGE,
 * без уточнения причины.
 */
class RegistrationService : public ports::input::IRegistrationService {
public:
    static constexpr size_t NONCE_BYTES = 32;
    static constexpr const char* KEY_ALGORITHM = "secp384r1";
    static constexpr const char* HASH_ALGORITHM = "SHA256";

    RegistrationService(
        std::shared_ptr<ports::output::IContainerRepository> containerRepo,
        std::shared_ptr<ports::output::IChallengeRepository> challengeRepo,
        std::shared_ptr<EntityLockManager> locks,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        std::shared_ptr<settings::RegistrationSettings> settings
    ) : containerRepo_(std::move(containerRepo))
      , challengeRepo_(std::move(challengeRepo))
      , locks_(std::move(locks))
      , clock_(std::move(clock))
      , metrics_(std::move(metrics))
      , settings_(std::move(settings))
    {
        std::cout << "[RegistrationService] Created, server url: " << settings_->getServerUrl()
                  << ", ttl: " << settings_->getTtlMinutes() << " min" << std::endl;
    }

    domain::RegistrationOffer beginRegistration(
        const std::string& serial,
        const std::optional<std::string>& passphrasePrompt,
        const std::optional<std::string>& passphrase
    ) override {
        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);

        if (!domain::supportsRegistration(container.type)) {
            throw domain::ContainerError(domain::ErrorCode::UNSUPPORTED_ACTION,
                domain::toString(container.type) + " containers do not support registration");
        }

        auto now = clock_->now();
        auto previous = challengeRepo_->findByContainer(serial);
        auto state = domain::effectiveRegistrationState(
            container.registrationState, previous, now, settings_->getGrace());

        if (state == domain::RegistrationState::PENDING && previous->failedAttempts == 0) {
            throw domain::ContainerError(domain::ErrorCode::REGISTRATION_PENDING,
                "Registration of " + serial + " is already pending");
        }
        if (state == domain::RegistrationState::REGISTERED) {
            std::cout << "[RegistrationService] Re-registering " << serial
                      << ", previous device pairing dropped" << std::endl;
        }
        clearPairing(container);

        domain::RegistrationChallenge challenge;
        challenge.containerSerial = serial;
        challenge.nonce = utils::CryptoUtils::randomHex(NONCE_BYTES);
        challenge.issuedAt = now;
        challenge.expiresAt = now.plus(settings_->getTtl());
        challenge.passphrasePrompt = passphrasePrompt.value_or("");
        if (passphrase && !passphrase->empty()) {
            challenge.passphraseHash = utils::CryptoUtils::sha256Hex(*passphrase);
        }
        challengeRepo_->save(challenge);

        container.registrationState = domain::RegistrationState::PENDING;
        containerRepo_->save(container);
        metrics_->increment("registrations_started_total");

        std::cout << "[RegistrationService] Registration of " << serial << " started" << std::endl;
        return buildOffer(challenge);
    }

    void completeRegistration(
        const std::string& serial,
        const std::string& nonce,
        const std::optional<std::string>& passphrase,
        const domain::DeviceInfo& device
    ) override {
        // finalize не требует авторизации: неизвестный serial отклоняется до захвата блокировки
        if (!containerRepo_->exists(serial)) {
            reject(serial, "unknown container");
        }

        auto guard = locks_->lockContainer(serial);
        auto container = containerRepo_->findBySerial(serial);
        auto challenge = challengeRepo_->findByContainer(serial);

        if (!container || container->registrationState != domain::RegistrationState::PENDING || !challenge) {
            reject(serial, "no pending registration");
        }
        if (challenge->isExpired(clock_->now(), settings_->getGrace())) {
            reject(serial, "challenge expired");
        }

        bool nonceOk = utils::CryptoUtils::constantTimeEquals(nonce, challenge->nonce);
        bool passphraseOk = !challenge->requiresPassphrase()
            || (passphrase && utils::CryptoUtils::constantTimeEquals(
                    utils::CryptoUtils::sha256Hex(*passphrase), challenge->passphraseHash));
        if (!nonceOk || !passphraseOk) {
            challenge->failedAttempts += 1;
            challengeRepo_->save(*challenge);
            reject(serial, nonceOk ? "wrong passphrase" : "wrong nonce");
        }

        container->registrationState = domain::RegistrationState::REGISTERED;
        std::string deviceName = utils::trim(device.brand + " " + device.model);
        if (!deviceName.empty()) {
            container->info["device"] = deviceName;
        }
        container->info["public_key_container"] = device.publicKey;
        container->lastSynchronization = clock_->now();
        containerRepo_->save(*container);
        challengeRepo_->remove(serial);
        metrics_->increment("registrations_completed_total");

        std::cout << "[RegistrationService] Container " << serial << " registered" << std::endl;
    }

    void terminateRegistration(const std::string& serial) override {
        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);

        clearPairing(container);
        container.registrationState = domain::RegistrationState::UNREGISTERED;
        container.lastSynchronization.reset();
        containerRepo_->save(container);
        challengeRepo_->remove(serial);

        std::cout << "[RegistrationService] Registration of " << serial << " terminated" << std::endl;
    }

    domain::RegistrationState getRegistrationState(const std::string& serial) override {
        auto container = require(serial);
        return domain::effectiveRegistrationState(
            container.registrationState,
            challengeRepo_->findByContainer(serial),
            clock_->now(),
            settings_->getGrace());
    }

private:
    std::shared_ptr<ports::output::IContainerRepository> containerRepo_;
    std::shared_ptr<ports::output::IChallengeRepository> challengeRepo_;
    std::shared_ptr<EntityLockManager> locks_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    std::shared_ptr<settings::RegistrationSettings> settings_;

    domain::Container require(const std::string& serial) {
        auto container = containerRepo_->findBySerial(serial);
        if (!container) {
            throw domain::ContainerError::notFound("Container " + serial);
        }
        return *container;
    }

    static void clearPairing(domain::Container& container) {
        container.info.erase("device");
        container.info.erase("public_key_container");
    }

    [[noreturn]] void reject(const std::string& serial, const std::string& reason) {
        metrics_->increment("registrations_failed_total");
        std::cerr << "[RegistrationService] Registration of " << serial << " rejected: " << reason << std::endl;
        throw domain::ContainerError(domain::ErrorCode::INVALID_OR_EXPIRED_CHALLENGE,
            "Invalid or expired registration challenge");
    }

    domain::RegistrationOffer buildOffer(const domain::RegistrationChallenge& challenge) const {
        domain::RegistrationOffer offer;
        offer.containerSerial = challenge.containerSerial;
        offer.nonce = challenge.nonce;
        offer.timeStamp = challenge.issuedAt.toString();
        offer.ttlMinutes = settings_->getTtlMinutes();
        offer.keyAlgorithm = KEY_ALGORITHM;
        offer.hashAlgorithm = HASH_ALGORITHM;
        offer.sslVerify = settings_->getSslVerify();
        offer.passphrasePrompt = challenge.passphrasePrompt;
        offer.serverUrl = settings_->getServerUrl();

        offer.url = "pia://container/" + utils::urlEncode(challenge.containerSerial)
            + "?issuer=" + utils::urlEncode(settings_->getIssuer())
            + "&ttl=" + std::to_string(offer.ttlMinutes)
            + "&nonce=" + utils::urlEncode(offer.nonce)
            + "&time=" + utils::urlEncode(offer.timeStamp)
            + "&url=" + offer.serverUrl
            + "&serial=" + challenge.containerSerial
            + "&key_algorithm=" + utils::urlEncode(offer.keyAlgorithm)
            + "&hash_algorithm=" + utils::urlEncode(offer.hashAlgorithm)
            + "&ssl_verify=" + (offer.sslVerify ? "True" : "False")
            + "&passphrase=" + utils::urlEncode(offer.passphrasePrompt);
        return offer;
    }
};

} // namespace containers::application
