#pragma once

#include "enums/ContainerType.hpp"
#include "enums/ContainerState.hpp"
#include "enums/RegistrationState.hpp"
#include "Owner.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <set>
#include <map>
#include <optional>
#include <algorithm>

namespace containers::domain {

/**
 * @brief Контейнер токенов (смартфон, смарт-карта, ...)
 *
 * tokenSerials не хранится в репозитории контейнеров,
 * сервис заполняет его из реестра токенов при чтении.
 */
struct Container {
    std::string serial;
    ContainerType type = ContainerType::GENERIC;
    std::string description;
    std::optional<Owner> owner;
    std::vector<std::string> realms;            ///< Упорядоченное множество
    std::vector<std::string> tokenSerials;      ///< Порядок привязки
    OperationalState operationalState = OperationalState::ACTIVE;
    std::set<ConditionMarker> markers;
    std::map<std::string, std::string> info;
    std::optional<std::string> templateName;
    RegistrationState registrationState = RegistrationState::UNREGISTERED;
    Timestamp createdAt;
    std::optional<Timestamp> lastAuthentication;    ///< Последний успешный вход токеном контейнера
    std::optional<Timestamp> lastSynchronization;   ///< Последний обмен устройства с сервером

    Container() = default;

    Container(const std::string& serial, ContainerType type)
        : serial(serial), type(type), createdAt(Timestamp::now()) {}

    /**
     * @brief Состояния строками: рабочее состояние, затем отметки
     */
    std::vector<std::string> stateNames() const {
        std::vector<std::string> names{toString(operationalState)};
        for (auto marker : markers) {
            names.push_back(toString(marker));
        }
        return names;
    }

    bool hasRealm(const std::string& realm) const {
        return std::find(realms.begin(), realms.end(), realm) != realms.end();
    }

    void addRealm(const std::string& realm) {
        if (!realm.empty() && !hasRealm(realm)) {
            realms.push_back(realm);
        }
    }
};

} // namespace containers::domain
