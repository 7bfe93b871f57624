#pragma once

#include "ports/output/IContainerRepository.hpp"
#include "settings/DbSettings.hpp"
#include "utils/StringUtils.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>
#include <map>

namespace containers::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий контейнеров
 *
 * Соединение на каждый вызов, одна транзакция на операцию.
 * Realms и info перезаписываются целиком при save().
 */
class PostgresContainerRepository : public ports::output::IContainerRepository {
public:
    explicit PostgresContainerRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        std::cout << "[PostgresContainerRepository] Connected to " << settings_->getName() << std::endl;
    }

    void save(const domain::Container& container) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);

            std::optional<std::string> ownerUser, ownerRealm;
            if (container.owner) {
                ownerUser = container.owner->user;
                ownerRealm = container.owner->realm;
            }
            std::optional<int64_t> lastAuthentication, lastSynchronization;
            if (container.lastAuthentication) {
                lastAuthentication = container.lastAuthentication->toEpochMicros();
            }
            if (container.lastSynchronization) {
                lastSynchronization = container.lastSynchronization->toEpochMicros();
            }

            txn.exec_params(
                R"(
                    INSERT INTO containers (serial, type, description, owner_user, owner_realm,
                                            operational_state, markers, template_name,
                                            registration_state, created_at,
                                            last_authentication, last_synchronization)
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12)
                    ON CONFLICT (serial) DO UPDATE SET
                        description = EXCLUDED.description,
                        owner_user = EXCLUDED.owner_user,
                        owner_realm = EXCLUDED.owner_realm,
                        operational_state = EXCLUDED.operational_state,
                        markers = EXCLUDED.markers,
                        template_name = EXCLUDED.template_name,
                        registration_state = EXCLUDED.registration_state,
                        last_authentication = EXCLUDED.last_authentication,
                        last_synchronization = EXCLUDED.last_synchronization
                )",
                container.serial,
                domain::toString(container.type),
                container.description,
                ownerUser,
                ownerRealm,
                domain::toString(container.operationalState),
                joinMarkers(container.markers),
                container.templateName,
                domain::toString(container.registrationState),
                container.createdAt.toEpochMicros(),
                lastAuthentication,
                lastSynchronization
            );

            txn.exec_params("DELETE FROM container_realms WHERE container_serial = $1", container.serial);
            int position = 0;
            for (const auto& realm : container.realms) {
                txn.exec_params(
                    "INSERT INTO container_realms (container_serial, realm, position) VALUES ($1, $2, $3)",
                    container.serial, realm, position++);
            }

            txn.exec_params("DELETE FROM container_info WHERE container_serial = $1", container.serial);
            for (const auto& [key, value] : container.info) {
                txn.exec_params(
                    "INSERT INTO container_info (container_serial, key, value) VALUES ($1, $2, $3)",
                    container.serial, key, value);
            }

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresContainerRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Container> findBySerial(const std::string& serial) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);

            auto containers = load(txn, " WHERE serial = $1", "", serial);
            txn.commit();
            if (containers.empty()) {
                return std::nullopt;
            }
            return containers.front();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresContainerRepository] findBySerial() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Container> findAll() override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto containers = load(txn, "", " ORDER BY serial");
            txn.commit();
            return containers;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresContainerRepository] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Container> findByTemplate(const std::string& templateName) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto containers = load(txn, " WHERE template_name = $1", " ORDER BY serial", templateName);
            txn.commit();
            return containers;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresContainerRepository] findByTemplate() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool exists(const std::string& serial) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto result = txn.exec_params("SELECT 1 FROM containers WHERE serial = $1", serial);
            txn.commit();
            return !result.empty();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresContainerRepository] exists() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool remove(const std::string& serial) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto result = txn.exec_params("DELETE FROM containers WHERE serial = $1", serial);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresContainerRepository] remove() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    inline static const std::string SELECT_CONTAINER =
        "SELECT serial, type, description, owner_user, owner_realm, operational_state, markers, "
        "template_name, registration_state, created_at, last_authentication, last_synchronization "
        "FROM containers";

    static std::string joinMarkers(const std::set<domain::ConditionMarker>& markers) {
        std::string joined;
        for (auto marker : markers) {
            if (!joined.empty()) joined += ",";
            joined += domain::toString(marker);
        }
        return joined;
    }

    /**
     * @brief Собрать контейнеры по условию и догрузить их realms и info
     *
     * Дочерние таблицы читаются через join с тем же условием, поэтому
     * загружаются строки только выбранных контейнеров.
     */
    template<typename... Args>
    std::vector<domain::Container> load(
        pqxx::work& txn,
        const std::string& condition,
        const std::string& order,
        Args&&... args
    ) const {
        std::vector<domain::Container> containers;
        std::map<std::string, size_t> index;
        for (const auto& row : txn.exec_params(SELECT_CONTAINER + condition + order, args...)) {
            index[row["serial"].as<std::string>()] = containers.size();
            containers.push_back(rowToContainer(row));
        }
        if (containers.empty()) {
            return containers;
        }

        auto select = [&](const std::string& table, const std::string& columns, const std::string& childOrder) {
            return txn.exec_params(
                "SELECT " + columns + " FROM " + table
                + " JOIN containers ON containers.serial = " + table + ".container_serial"
                + condition + childOrder,
                args...);
        };

        auto realms = select("container_realms", "container_realms.container_serial, container_realms.realm",
                             " ORDER BY container_realms.container_serial, container_realms.position");
        for (const auto& row : realms) {
            auto it = index.find(row["container_serial"].as<std::string>());
            if (it != index.end()) {
                containers[it->second].realms.push_back(row["realm"].as<std::string>());
            }
        }

        auto info = select("container_info",
                           "container_info.container_serial, container_info.key, container_info.value", "");
        for (const auto& row : info) {
            auto it = index.find(row["container_serial"].as<std::string>());
            if (it != index.end()) {
                containers[it->second].info[row["key"].as<std::string>()] = row["value"].as<std::string>();
            }
        }
        return containers;
    }

    domain::Container rowToContainer(const pqxx::row& row) const {
        domain::Container container;
        container.serial = row["serial"].as<std::string>();
        container.type = domain::containerTypeFromString(row["type"].as<std::string>())
                             .value_or(domain::ContainerType::GENERIC);
        container.description = row["description"].as<std::string>();
        if (!row["owner_user"].is_null()) {
            container.owner = domain::Owner(
                row["owner_user"].as<std::string>(),
                row["owner_realm"].is_null() ? "" : row["owner_realm"].as<std::string>());
        }
        container.operationalState = domain::operationalStateFromString(row["operational_state"].as<std::string>())
                                         .value_or(domain::OperationalState::ACTIVE);
        for (const auto& name : utils::splitList(row["markers"].as<std::string>())) {
            if (auto marker = domain::conditionMarkerFromString(name)) {
                container.markers.insert(*marker);
            }
        }
        if (!row["template_name"].is_null()) {
            container.templateName = row["template_name"].as<std::string>();
        }
        container.registrationState = domain::registrationStateFromString(row["registration_state"].as<std::string>());
        container.createdAt = domain::Timestamp::fromEpochMicros(row["created_at"].as<int64_t>());
        if (!row["last_authentication"].is_null()) {
            container.lastAuthentication = domain::Timestamp::fromEpochMicros(row["last_authentication"].as<int64_t>());
        }
        if (!row["last_synchronization"].is_null()) {
            container.lastSynchronization = domain::Timestamp::fromEpochMicros(row["last_synchronization"].as<int64_t>());
        }
        return container;
    }
};

} // namespace containers::adapters::secondary
