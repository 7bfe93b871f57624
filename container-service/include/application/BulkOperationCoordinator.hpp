#pragma once

#include "ports/input/IBulkOperationService.hpp"
#include "ports/input/ITokenRegistry.hpp"
#include "ports/output/IContainerRepository.hpp"
#include "application/EntityLockManager.hpp"
#include "domain/ContainerError.hpp"
#include "domain/enums/BulkAction.hpp"

#include <memory>
#include <iostream>
#include <stdexcept>
#include <algorithm>

namespace containers::application {

/**
 * @brief Пакетные операции над токенами контейнера
 *
 * Контракт атомарности:
 * - activate/deactivate: поштучно, ошибка одного токена не останавливает остальные;
 * - remove/removeTokens: один вызов ITokenRegistry::detachAll, все или ничего.
 */
class BulkOperationCoordinator : public ports::input::IBulkOperationService {
public:
    BulkOperationCoordinator(
        std::shared_ptr<ports::output::IContainerRepository> containerRepo,
        std::shared_ptr<ports::input::ITokenRegistry> tokenRegistry,
        std::shared_ptr<EntityLockManager> locks
    ) : containerRepo_(std::move(containerRepo))
      , tokenRegistry_(std::move(tokenRegistry))
      , locks_(std::move(locks))
    {
        std::cout << "[BulkOperationCoordinator] Created" << std::endl;
    }

    domain::BatchResult bulkAction(const std::string& serial, const std::string& actionName) override {
        auto action = domain::bulkActionFromString(actionName);
        if (!action) {
            throw domain::ContainerError(domain::ErrorCode::UNSUPPORTED_ACTION,
                "Unsupported action: " + actionName);
        }

        auto guard = locks_->lockContainer(serial);
        requireContainer(serial);
        auto tokens = tokenRegistry_->findByContainer(serial);

        domain::BatchResult result;

        if (*action == domain::BulkAction::REMOVE) {
            if (tokens.empty()) {
                result.note = "No tokens in container " + serial;
                return result;
            }
            std::vector<std::string> serials;
            for (const auto& token : tokens) {
                serials.push_back(token.serial);
            }
            detachOrThrow(serial, serials, true);
            for (const auto& tokenSerial : serials) {
                result.succeed(tokenSerial, "deleted");
            }
            std::cout << "[BulkOperationCoordinator] Removed " << serials.size()
                      << " tokens of " << serial << std::endl;
            return result;
        }

        bool target = *action == domain::BulkAction::ACTIVATE;
        for (const auto& token : tokens) {
            if (token.active == target) {
                continue;
            }
            try {
                tokenRegistry_->setActive(token.serial, target);
                result.succeed(token.serial, target ? "activated" : "deactivated");
            } catch (const domain::ContainerError& e) {
                result.fail(token.serial, e.what());
            }
        }

        if (result.items.empty()) {
            result.note = "No tokens to " + actionName + " in container " + serial;
        }
        std::cout << "[BulkOperationCoordinator] " << actionName << " on " << serial << ": "
                  << result.items.size() - result.failures() << "/" << result.items.size()
                  << " tokens" << std::endl;
        return result;
    }

    domain::BatchResult removeTokens(
        const std::string& serial,
        const std::vector<std::string>& tokenSerials,
        bool deleteTokens
    ) override {
        domain::BatchResult result;
        if (tokenSerials.empty()) {
            result.note = "No tokens given";
            return result;
        }

        std::vector<std::string> unique;
        for (const auto& tokenSerial : tokenSerials) {
            if (std::find(unique.begin(), unique.end(), tokenSerial) == unique.end()) {
                unique.push_back(tokenSerial);
            }
        }

        LockSet set;
        set.containers.insert(serial);
        set.tokens.insert(unique.begin(), unique.end());
        auto guard = locks_->lock(set);
        requireContainer(serial);

        for (const auto& tokenSerial : unique) {
            auto token = tokenRegistry_->find(tokenSerial);
            if (!token || token->containerSerial != serial) {
                throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER,
                    "Token " + tokenSerial + " is not in container " + serial + ", nothing removed");
            }
        }

        detachOrThrow(serial, unique, deleteTokens);
        for (const auto& tokenSerial : unique) {
            result.succeed(tokenSerial, deleteTokens ? "deleted" : "removed");
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::IContainerRepository> containerRepo_;
    std::shared_ptr<ports::input::ITokenRegistry> tokenRegistry_;
    std::shared_ptr<EntityLockManager> locks_;

    void requireContainer(const std::string& serial) {
        if (!containerRepo_->exists(serial)) {
            throw domain::ContainerError::notFound("Container " + serial);
        }
    }

    void detachOrThrow(const std::string& serial, const std::vector<std::string>& serials, bool deleteTokens) {
        if (!tokenRegistry_->detachAll(serial, serials, deleteTokens)) {
            throw std::runtime_error("Tokens of container " + serial + " changed during bulk removal");
        }
    }
};

} // namespace containers::application
