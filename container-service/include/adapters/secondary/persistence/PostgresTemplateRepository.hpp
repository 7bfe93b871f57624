#pragma once

#include "ports/output/ITemplateRepository.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/JsonMapping.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace containers::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий шаблонов
 *
 * Спецификации токенов хранятся JSON массивом в token_specs.
 */
class PostgresTemplateRepository : public ports::output::ITemplateRepository {
public:
    explicit PostgresTemplateRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        std::cout << "[PostgresTemplateRepository] Connected to " << settings_->getName() << std::endl;
    }

    void save(const domain::ContainerTemplate& tmpl) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            txn.exec_params(
                R"(
                    INSERT INTO container_templates (name, container_type, token_specs, is_default, created_at)
                    VALUES ($1, $2, $3, $4, $5)
                    ON CONFLICT (name) DO UPDATE SET
                        container_type = EXCLUDED.container_type,
                        token_specs = EXCLUDED.token_specs,
                        is_default = EXCLUDED.is_default
                )",
                tmpl.name,
                domain::toString(tmpl.containerType),
                json::tokenSpecsToJson(tmpl.tokens).dump(),
                tmpl.isDefault,
                tmpl.createdAt.toEpochMicros()
            );
            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTemplateRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::ContainerTemplate> findByName(const std::string& name) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto result = txn.exec_params(SELECT_TEMPLATE + " WHERE name = $1", name);
            txn.commit();
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToTemplate(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTemplateRepository] findByName() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::ContainerTemplate> findAll() override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto result = txn.exec(SELECT_TEMPLATE + " ORDER BY name");
            txn.commit();

            std::vector<domain::ContainerTemplate> templates;
            for (const auto& row : result) {
                templates.push_back(rowToTemplate(row));
            }
            return templates;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTemplateRepository] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool exists(const std::string& name) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto result = txn.exec_params("SELECT 1 FROM container_templates WHERE name = $1", name);
            txn.commit();
            return !result.empty();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTemplateRepository] exists() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool remove(const std::string& name) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto result = txn.exec_params("DELETE FROM container_templates WHERE name = $1", name);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTemplateRepository] remove() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    inline static const std::string SELECT_TEMPLATE =
        "SELECT name, container_type, token_specs, is_default, created_at FROM container_templates";

    domain::ContainerTemplate rowToTemplate(const pqxx::row& row) const {
        domain::ContainerTemplate tmpl;
        tmpl.name = row["name"].as<std::string>();
        tmpl.containerType = domain::containerTypeFromString(row["container_type"].as<std::string>())
                                 .value_or(domain::ContainerType::GENERIC);
        tmpl.tokens = json::tokenSpecsFromJson(nlohmann::json::parse(row["token_specs"].as<std::string>()));
        tmpl.isDefault = row["is_default"].as<bool>();
        tmpl.createdAt = domain::Timestamp::fromEpochMicros(row["created_at"].as<int64_t>());
        return tmpl;
    }
};

} // namespace containers::adapters::secondary
