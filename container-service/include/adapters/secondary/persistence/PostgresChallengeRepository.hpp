#pragma once

#include "ports/output/IChallengeRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace containers::adapters::secondary {

/**
 * @brief PostgreSQL хранилище challenge регистрации
 *
 * Строка удаляется вместе с контейнером (ON DELETE CASCADE).
 */
class PostgresChallengeRepository : public ports::output::IChallengeRepository {
public:
    explicit PostgresChallengeRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        std::cout << "[PostgresChallengeRepository] Connected to " << settings_->getName() << std::endl;
    }

    void save(const domain::RegistrationChallenge& challenge) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            txn.exec_params(
                R"(
                    INSERT INTO registration_challenges (container_serial, nonce, issued_at, expires_at,
                                                         passphrase_prompt, passphrase_hash, failed_attempts)
                    VALUES ($1, $2, $3, $4, $5, $6, $7)
                    ON CONFLICT (container_serial) DO UPDATE SET
                        nonce = EXCLUDED.nonce,
                        issued_at = EXCLUDED.issued_at,
                        expires_at = EXCLUDED.expires_at,
                        passphrase_prompt = EXCLUDED.passphrase_prompt,
                        passphrase_hash = EXCLUDED.passphrase_hash,
                        failed_attempts = EXCLUDED.failed_attempts
                )",
                challenge.containerSerial,
                challenge.nonce,
                challenge.issuedAt.toEpochMicros(),
                challenge.expiresAt.toEpochMicros(),
                challenge.passphrasePrompt,
                challenge.passphraseHash,
                challenge.failedAttempts
            );
            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresChallengeRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::RegistrationChallenge> findByContainer(const std::string& containerSerial) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto result = txn.exec_params(
                R"(SELECT container_serial, nonce, issued_at, expires_at,
                          passphrase_prompt, passphrase_hash, failed_attempts
                   FROM registration_challenges WHERE container_serial = $1)",
                containerSerial);
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }

            const auto& row = result[0];
            domain::RegistrationChallenge challenge;
            challenge.containerSerial = row["container_serial"].as<std::string>();
            challenge.nonce = row["nonce"].as<std::string>();
            challenge.issuedAt = domain::Timestamp::fromEpochMicros(row["issued_at"].as<int64_t>());
            challenge.expiresAt = domain::Timestamp::fromEpochMicros(row["expires_at"].as<int64_t>());
            challenge.passphrasePrompt = row["passphrase_prompt"].as<std::string>();
            challenge.passphraseHash = row["passphrase_hash"].as<std::string>();
            challenge.failedAttempts = row["failed_attempts"].as<int>();
            return challenge;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresChallengeRepository] findByContainer() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool remove(const std::string& containerSerial) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto result = txn.exec_params(
                "DELETE FROM registration_challenges WHERE container_serial = $1", containerSerial);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresChallengeRepository] remove() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace containers::adapters::secondary
