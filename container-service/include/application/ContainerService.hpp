#pragma once

#include "ports/input/IContainerService.hpp"
#include "ports/input/ITokenRegistry.hpp"
#include "ports/input/ITemplateService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IContainerRepository.hpp"
#include "ports/output/IChallengeRepository.hpp"
#include "ports/output/IClock.hpp"
#include "settings/RegistrationSettings.hpp"
#include "application/EntityLockManager.hpp"
#include "domain/ContainerError.hpp"
#include "utils/SerialGenerator.hpp"
#include "utils/StringUtils.hpp"

#include <memory>
#include <iostream>
#include <algorithm>
#include <stdexcept>

namespace containers::application {

/**
 * @brief Реестр контейнеров
 *
 * Мутации контейнера выполняются под его блокировкой. Операции,
 * затрагивающие токены, дополнительно берут блокировки токенов
 * (после контейнеров, см. EntityLockManager).
 */
class ContainerService : public ports::input::IContainerService {
public:
    /// Ключи info, которыми управляет только регистрация
    static bool isProtectedInfoKey(const std::string& key) {
        return key == "registration_state" || key == "public_key_container" || key == "device";
    }

    ContainerService(
        std::shared_ptr<ports::output::IContainerRepository> containerRepo,
        std::shared_ptr<ports::input::ITokenRegistry> tokenRegistry,
        std::shared_ptr<ports::input::ITemplateService> templateService,
        std::shared_ptr<ports::output::IChallengeRepository> challengeRepo,
        std::shared_ptr<EntityLockManager> locks,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        std::shared_ptr<settings::RegistrationSettings> registrationSettings
    ) : containerRepo_(std::move(containerRepo))
      , tokenRegistry_(std::move(tokenRegistry))
      , templateService_(std::move(templateService))
      , challengeRepo_(std::move(challengeRepo))
      , locks_(std::move(locks))
      , clock_(std::move(clock))
      , metrics_(std::move(metrics))
      , registrationSettings_(std::move(registrationSettings))
    {
        std::cout << "[ContainerService] Created" << std::endl;
    }

    ports::input::CreateContainerResult createContainer(
        const ports::input::CreateContainerRequest& request
    ) override {
        auto type = domain::containerTypeFromString(request.type);
        if (!type) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER,
                "Unknown container type: " + request.type);
        }
        if (request.owner && request.owner->user.empty()) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "User name is required");
        }

        std::string serial;
        do {
            serial = utils::SerialGenerator::generate(domain::serialPrefix(*type));
        } while (containerRepo_->exists(serial));

        // Шаблон держим до конца выпуска токенов: его тип не сменится и удалить его нельзя
        LockSet lockSet;
        lockSet.containers.insert(serial);
        if (request.templateName) {
            lockSet.templates.insert(*request.templateName);
        }
        auto guard = locks_->lock(lockSet);

        if (request.templateName) {
            auto tmpl = templateService_->getTemplate(*request.templateName);
            if (!tmpl) {
                throw domain::ContainerError::notFound("Template " + *request.templateName);
            }
            if (tmpl->containerType != *type) {
                throw domain::ContainerError(domain::ErrorCode::TYPE_MISMATCH,
                    "Template " + tmpl->name + " is for " + domain::toString(tmpl->containerType)
                    + " containers, not " + domain::toString(*type));
            }
        }

        domain::Container container(serial, *type);
        container.description = request.description;
        container.createdAt = clock_->now();
        container.templateName = request.templateName;
        if (request.owner) {
            container.owner = request.owner;
            container.addRealm(request.owner->realm);
        }
        containerRepo_->save(container);
        metrics_->increment("containers_created_total", {{"type", domain::toString(*type)}});

        std::cout << "[ContainerService] Created " << domain::toString(*type)
                  << " container " << serial << std::endl;

        ports::input::CreateContainerResult result;
        result.serial = serial;

        if (request.templateName) {
            for (const auto& spec : templateService_->instantiate(*request.templateName, serial)) {
                std::string typeName = domain::toString(spec.type);
                auto provisioned = tokenRegistry_->provision(typeName, spec.settings, request.owner);
                if (!provisioned.success) {
                    result.tokens.fail(typeName, toString(domain::ErrorCode::PROVISIONING_ERROR)
                                                 + ": " + provisioned.message);
                    continue;
                }
                tokenRegistry_->bindToContainer(provisioned.serial, serial);
                result.tokens.succeed(provisioned.serial, typeName);
            }
            std::cout << "[ContainerService] Template " << *request.templateName << ": "
                      << result.tokens.items.size() - result.tokens.failures() << "/"
                      << result.tokens.items.size() << " tokens provisioned" << std::endl;
        }

        return result;
    }

    domain::Container getContainer(const std::string& serial) override {
        return hydrate(require(serial));
    }

    domain::ContainerPage listContainers(const domain::ContainerQuery& query) override {
        if (query.sortBy != "serial" && query.sortBy != "type" && query.sortBy != "description") {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER,
                "Unsupported sort field: " + query.sortBy);
        }

        std::vector<domain::Container> matched;
        for (auto& stored : containerRepo_->findAll()) {
            if (query.serial && !utils::wildcardMatch(*query.serial, stored.serial)) continue;
            if (query.type && !utils::wildcardMatch(*query.type, domain::toString(stored.type))) continue;
            if (query.user && (!stored.owner || !utils::wildcardMatch(*query.user, stored.owner->user))) continue;
            if (query.realm && std::none_of(stored.realms.begin(), stored.realms.end(),
                    [&query](const std::string& realm) { return utils::wildcardMatch(*query.realm, realm); })) continue;
            if (query.description && !utils::wildcardMatch(*query.description, stored.description)) continue;
            if (query.templateName && stored.templateName != query.templateName) continue;

            auto container = hydrate(std::move(stored));
            if (query.tokenSerial) {
                const auto& tokens = container.tokenSerials;
                if (std::find(tokens.begin(), tokens.end(), *query.tokenSerial) == tokens.end()) continue;
            }
            matched.push_back(std::move(container));
        }

        auto key = [&query](const domain::Container& c) {
            if (query.sortBy == "type") return domain::toString(c.type);
            if (query.sortBy == "description") return c.description;
            return c.serial;
        };
        std::sort(matched.begin(), matched.end(), [&](const auto& a, const auto& b) {
            auto ka = key(a), kb = key(b);
            if (ka != kb) return query.sortDescending ? ka > kb : ka < kb;
            return a.serial < b.serial;
        });

        domain::ContainerPage page;
        page.count = matched.size();
        page.current = std::max(1, query.page);

        if (query.pageSize < 1) {
            page.containers = std::move(matched);
            return page;
        }

        size_t begin = static_cast<size_t>(page.current - 1) * static_cast<size_t>(query.pageSize);
        size_t end = std::min(matched.size(), begin + static_cast<size_t>(query.pageSize));
        for (size_t i = begin; i < end; ++i) {
            page.containers.push_back(std::move(matched[i]));
        }
        if (page.current > 1) {
            page.prev = page.current - 1;
        }
        if (end < matched.size()) {
            page.next = page.current + 1;
        }
        return page;
    }

    std::vector<std::string> setRealms(
        const std::string& serial,
        const std::vector<std::string>& realms
    ) override {
        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);

        container.realms.clear();
        for (const auto& realm : realms) {
            container.addRealm(realm);
        }
        if (container.owner && !container.owner->realm.empty() && !container.hasRealm(container.owner->realm)) {
            std::cout << "[ContainerService] Keeping realm " << container.owner->realm
                      << " of owner " << container.owner->toString() << " on " << serial << std::endl;
            container.addRealm(container.owner->realm);
        }

        containerRepo_->save(container);
        return container.realms;
    }

    std::map<std::string, bool> addRealms(
        const std::string& serial,
        const std::vector<std::string>& realms
    ) override {
        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);

        std::map<std::string, bool> result;
        for (const auto& realm : realms) {
            if (realm.empty()) {
                continue;
            }
            bool added = !container.hasRealm(realm);
            if (!added) {
                std::cout << "[ContainerService] Realm " << realm << " already assigned to " << serial << std::endl;
            }
            container.addRealm(realm);
            result.emplace(realm, added);
        }

        containerRepo_->save(container);
        return result;
    }

    void setDescription(const std::string& serial, const std::string& description) override {
        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);
        container.description = description;
        containerRepo_->save(container);
    }

    void setInfo(const std::string& serial, const std::string& key, const std::string& value) override {
        checkInfoKey(key);
        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);
        container.info[key] = value;
        containerRepo_->save(container);
    }

    bool deleteInfo(const std::string& serial, const std::string& key) override {
        checkInfoKey(key);
        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);
        if (container.info.erase(key) == 0) {
            return false;
        }
        containerRepo_->save(container);
        return true;
    }

    void assignUser(const std::string& serial, const domain::Owner& owner, bool force) override {
        if (owner.user.empty()) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "User name is required");
        }

        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);

        if (container.owner && *container.owner != owner && !force) {
            throw domain::ContainerError(domain::ErrorCode::OWNERSHIP_CONFLICT,
                "Container " + serial + " is already assigned to " + container.owner->toString());
        }
        for (const auto& token : tokenRegistry_->findByContainer(serial)) {
            if (token.owner && *token.owner != owner && !force) {
                throw domain::ContainerError(domain::ErrorCode::OWNERSHIP_CONFLICT,
                    "Token " + token.serial + " in container " + serial + " belongs to "
                    + token.owner->toString());
            }
        }

        if (container.owner && *container.owner != owner) {
            std::cout << "[ContainerService] Reassigning " << serial << " from "
                      << container.owner->toString() << " (forced)" << std::endl;
        }
        container.owner = owner;
        container.addRealm(owner.realm);
        containerRepo_->save(container);

        std::cout << "[ContainerService] Assigned " << serial << " to " << owner.toString() << std::endl;
    }

    bool unassignUser(const std::string& serial, const domain::Owner& owner) override {
        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);

        if (!container.owner || container.owner->user != owner.user
            || (!owner.realm.empty() && container.owner->realm != owner.realm)) {
            return false;
        }

        container.owner.reset();
        containerRepo_->save(container);
        std::cout << "[ContainerService] Unassigned " << owner.user << " from " << serial << std::endl;
        return true;
    }

    std::map<std::string, bool> setStates(
        const std::string& serial,
        const std::vector<std::string>& states
    ) override {
        checkExclusiveStates(states);

        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);

        container.markers.clear();
        auto result = applyStates(container, states);
        containerRepo_->save(container);
        return result;
    }

    std::map<std::string, bool> addStates(
        const std::string& serial,
        const std::vector<std::string>& states
    ) override {
        if (states.empty()) {
            return {};
        }
        checkExclusiveStates(states);

        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);

        // active/disabled хранится одним полем: новое значение вытесняет исключённое
        auto result = applyStates(container, states);
        containerRepo_->save(container);
        return result;
    }

    void recordAuthentication(const std::string& serial) override {
        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);
        container.lastAuthentication = clock_->now();
        containerRepo_->save(container);
    }

    void recordSynchronization(const std::string& serial) override {
        auto guard = locks_->lockContainer(serial);
        auto container = require(serial);
        container.lastSynchronization = clock_->now();
        containerRepo_->save(container);
    }

    bool addToken(const std::string& serial, const std::string& tokenSerial, bool force) override {
        for (int attempt = 0; attempt < MAX_MOVE_ATTEMPTS; ++attempt) {
            auto token = tokenRegistry_->find(tokenSerial);
            if (!token) {
                throw domain::ContainerError::notFound("Token " + tokenSerial);
            }
            auto previous = token->containerSerial;

            LockSet set;
            set.containers.insert(serial);
            if (previous) {
                set.containers.insert(*previous);
            }
            set.tokens.insert(tokenSerial);
            auto guard = locks_->lock(set);

            // Привязка могла измениться, пока мы ждали блокировки
            token = tokenRegistry_->find(tokenSerial);
            if (!token) {
                throw domain::ContainerError::notFound("Token " + tokenSerial);
            }
            if (token->containerSerial != previous) {
                continue;
            }

            auto container = require(serial);
            if (previous && *previous == serial) {
                return false;
            }
            if (!domain::supportsTokenType(container.type, token->type)) {
                throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER,
                    "Token type " + domain::toString(token->type) + " is not supported by "
                    + domain::toString(container.type) + " containers");
            }
            if (token->owner && container.owner && *token->owner != *container.owner && !force) {
                throw domain::ContainerError(domain::ErrorCode::OWNERSHIP_CONFLICT,
                    "Token " + tokenSerial + " belongs to " + token->owner->toString()
                    + ", container " + serial + " to " + container.owner->toString());
            }

            if (previous) {
                std::cout << "[ContainerService] Moving token " << tokenSerial
                          << " from " << *previous << " to " << serial << std::endl;
            }
            tokenRegistry_->bindToContainer(tokenSerial, serial);
            return true;
        }
        throw std::runtime_error("Token " + tokenSerial + " binding keeps changing, giving up");
    }

    bool removeToken(const std::string& serial, const std::string& tokenSerial) override {
        LockSet set;
        set.containers.insert(serial);
        set.tokens.insert(tokenSerial);
        auto guard = locks_->lock(set);

        require(serial);
        auto token = tokenRegistry_->find(tokenSerial);
        if (!token) {
            throw domain::ContainerError::notFound("Token " + tokenSerial);
        }
        if (token->containerSerial != serial) {
            return false;
        }
        return tokenRegistry_->unbind(tokenSerial);
    }

    void deleteContainer(const std::string& serial, bool cascade, bool deleteTokens) override {
        auto guard = locks_->lockContainer(serial);
        require(serial);

        std::vector<std::string> bound;
        for (const auto& token : tokenRegistry_->findByContainer(serial)) {
            bound.push_back(token.serial);
        }

        if (!bound.empty()) {
            if (!cascade) {
                throw domain::ContainerError(domain::ErrorCode::HAS_BOUND_TOKENS,
                    "Container " + serial + " still has " + std::to_string(bound.size()) + " tokens");
            }
            if (!tokenRegistry_->detachAll(serial, bound, deleteTokens)) {
                throw std::runtime_error("Tokens of container " + serial + " changed during delete");
            }
            std::cout << "[ContainerService] " << (deleteTokens ? "Deleted " : "Detached ")
                      << bound.size() << " tokens of " << serial << std::endl;
        }

        containerRepo_->remove(serial);
        challengeRepo_->remove(serial);
        metrics_->increment("containers_deleted_total");
        std::cout << "[ContainerService] Deleted container " << serial << std::endl;
    }

private:
    static constexpr int MAX_MOVE_ATTEMPTS = 8;

    std::shared_ptr<ports::output::IContainerRepository> containerRepo_;
    std::shared_ptr<ports::input::ITokenRegistry> tokenRegistry_;
    std::shared_ptr<ports::input::ITemplateService> templateService_;
    std::shared_ptr<ports::output::IChallengeRepository> challengeRepo_;
    std::shared_ptr<EntityLockManager> locks_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    std::shared_ptr<settings::RegistrationSettings> registrationSettings_;

    domain::Container require(const std::string& serial) {
        auto container = containerRepo_->findBySerial(serial);
        if (!container) {
            throw domain::ContainerError::notFound("Container " + serial);
        }
        return *container;
    }

    /**
     * @brief Заполнить список токенов и фактическое состояние регистрации
     */
    domain::Container hydrate(domain::Container container) {
        container.tokenSerials.clear();
        for (const auto& token : tokenRegistry_->findByContainer(container.serial)) {
            container.tokenSerials.push_back(token.serial);
        }
        if (container.registrationState == domain::RegistrationState::PENDING) {
            container.registrationState = domain::effectiveRegistrationState(
                container.registrationState,
                challengeRepo_->findByContainer(container.serial),
                clock_->now(),
                registrationSettings_->getGrace());
        }
        return container;
    }

    static void checkInfoKey(const std::string& key) {
        if (key.empty()) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Info key is required");
        }
        if (isProtectedInfoKey(key)) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER,
                "Info key " + key + " is managed by registration");
        }
    }

    static void checkExclusiveStates(const std::vector<std::string>& states) {
        bool hasActive = std::find(states.begin(), states.end(), "active") != states.end();
        bool hasDisabled = std::find(states.begin(), states.end(), "disabled") != states.end();
        if (hasActive && hasDisabled) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER,
                "States active and disabled are mutually exclusive");
        }
    }

    /**
     * @brief Применить состояния к контейнеру; неизвестные имена отмечаются false
     */
    static std::map<std::string, bool> applyStates(domain::Container& container, const std::vector<std::string>& states) {
        std::map<std::string, bool> result;
        for (const auto& name : states) {
            if (auto state = domain::operationalStateFromString(name)) {
                container.operationalState = *state;
                result[name] = true;
            } else if (auto marker = domain::conditionMarkerFromString(name)) {
                container.markers.insert(*marker);
                result[name] = true;
            } else {
                std::cerr << "[ContainerService] Unsupported state " << name << " for " << container.serial << std::endl;
                result[name] = false;
            }
        }
        return result;
    }
};

} // namespace containers::application
