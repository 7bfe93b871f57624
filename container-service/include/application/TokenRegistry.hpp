#pragma once

#include "ports/input/ITokenRegistry.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ITokenRepository.hpp"
#include "ports/output/IClock.hpp"
#include "application/EntityLockManager.hpp"
#include "domain/ContainerError.hpp"
#include "utils/SerialGenerator.hpp"

#include <memory>
#include <iostream>

namespace containers::application {

/**
 * @brief Реестр токенов
 *
 * Каждая мутация выполняется под блокировкой токена.
 * Блокировки контейнеров здесь не захватываются никогда.
 */
class TokenRegistry : public ports::input::ITokenRegistry {
public:
    TokenRegistry(
        std::shared_ptr<ports::output::ITokenRepository> tokenRepo,
        std::shared_ptr<EntityLockManager> locks,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : tokenRepo_(std::move(tokenRepo))
      , locks_(std::move(locks))
      , clock_(std::move(clock))
      , metrics_(std::move(metrics))
    {
        std::cout << "[TokenRegistry] Created" << std::endl;
    }

    ports::input::ProvisionResult provision(
        const std::string& type,
        const std::map<std::string, std::string>& settings,
        const std::optional<domain::Owner>& owner
    ) override {
        ports::input::ProvisionResult result;

        auto tokenType = domain::tokenTypeFromString(type);
        if (!tokenType) {
            return fail(result, "Unknown token type: " + type);
        }

        std::string error = validateSettings(*tokenType, settings);
        if (!error.empty()) {
            return fail(result, error);
        }

        std::string serial;
        do {
            serial = utils::SerialGenerator::generate(domain::serialPrefix(*tokenType));
        } while (tokenRepo_->exists(serial));

        domain::Token token(serial, *tokenType);
        token.owner = owner;
        token.info = settings;
        token.createdAt = clock_->now();
        tokenRepo_->save(token);

        metrics_->increment("tokens_provisioned_total");
        std::cout << "[TokenRegistry] Provisioned " << domain::toString(*tokenType)
                  << " token " << serial << std::endl;

        result.success = true;
        result.serial = serial;
        result.message = "Token provisioned";
        return result;
    }

    void bindToContainer(const std::string& tokenSerial, const std::string& containerSerial) override {
        auto guard = locks_->lockToken(tokenSerial);
        auto token = require(tokenSerial);
        token.containerSerial = containerSerial;
        token.boundAt = clock_->now();
        tokenRepo_->save(token);
    }

    bool unbind(const std::string& tokenSerial) override {
        auto guard = locks_->lockToken(tokenSerial);
        auto token = require(tokenSerial);
        if (!token.containerSerial) {
            return false;
        }
        token.containerSerial.reset();
        tokenRepo_->save(token);
        return true;
    }

    bool setActive(const std::string& tokenSerial, bool active) override {
        auto guard = locks_->lockToken(tokenSerial);
        auto token = require(tokenSerial);
        if (token.active == active) {
            return false;
        }
        token.active = active;
        tokenRepo_->save(token);
        return true;
    }

    bool remove(const std::string& tokenSerial) override {
        auto guard = locks_->lockToken(tokenSerial);
        bool removed = tokenRepo_->remove(tokenSerial);
        if (removed) {
            std::cout << "[TokenRegistry] Deleted token " << tokenSerial << std::endl;
        }
        return removed;
    }

    bool detachAll(
        const std::string& containerSerial,
        const std::vector<std::string>& serials,
        bool deleteTokens
    ) override {
        LockSet set;
        set.tokens.insert(serials.begin(), serials.end());
        auto guard = locks_->lock(set);
        return tokenRepo_->detachAll(containerSerial, serials, deleteTokens);
    }

    std::optional<domain::Token> find(const std::string& serial) override {
        return tokenRepo_->findBySerial(serial);
    }

    std::vector<domain::Token> findByContainer(const std::string& containerSerial) override {
        return tokenRepo_->findByContainer(containerSerial);
    }

    std::vector<domain::Token> list() override {
        return tokenRepo_->findAll();
    }

private:
    std::shared_ptr<ports::output::ITokenRepository> tokenRepo_;
    std::shared_ptr<EntityLockManager> locks_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    domain::Token require(const std::string& tokenSerial) {
        auto token = tokenRepo_->findBySerial(tokenSerial);
        if (!token) {
            throw domain::ContainerError::notFound("Token " + tokenSerial);
        }
        return *token;
    }

    ports::input::ProvisionResult& fail(ports::input::ProvisionResult& result, const std::string& message) {
        metrics_->increment("provisioning_failures_total");
        std::cerr << "[TokenRegistry] Provisioning failed: " << message << std::endl;
        result.success = false;
        result.message = message;
        return result;
    }

    /**
     * @brief Проверка настроек выпуска
     * @return Пустая строка если настройки корректны, иначе текст ошибки
     */
    static std::string validateSettings(
        domain::TokenType type,
        const std::map<std::string, std::string>& settings
    ) {
        bool isOtp = type == domain::TokenType::HOTP
                  || type == domain::TokenType::TOTP
                  || type == domain::TokenType::DAYPASSWORD;
        if (!isOtp) {
            return "";
        }

        auto otplen = settings.find("otplen");
        if (otplen != settings.end() && otplen->second != "6" && otplen->second != "8") {
            return "Invalid otplen: " + otplen->second;
        }

        auto hashlib = settings.find("hashlib");
        if (hashlib != settings.end() && hashlib->second != "sha1"
            && hashlib->second != "sha256" && hashlib->second != "sha512") {
            return "Invalid hashlib: " + hashlib->second;
        }

        auto timeStep = settings.find("timeStep");
        if (type == domain::TokenType::TOTP && timeStep != settings.end()
            && timeStep->second != "30" && timeStep->second != "60") {
            return "Invalid timeStep: " + timeStep->second;
        }

        return "";
    }
};

} // namespace containers::application
