#pragma once

#include "ports/output/ITokenRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <map>
#include <iostream>

namespace containers::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий токенов
 *
 * detachAll блокирует строки токенов (SELECT ... FOR UPDATE),
 * проверяет привязку и меняет все строки в одной транзакции.
 */
class PostgresTokenRepository : public ports::output::ITokenRepository {
public:
    explicit PostgresTokenRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        std::cout << "[PostgresTokenRepository] Connected to " << settings_->getName() << std::endl;
    }

    void save(const domain::Token& token) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);

            std::optional<std::string> ownerUser, ownerRealm;
            if (token.owner) {
                ownerUser = token.owner->user;
                ownerRealm = token.owner->realm;
            }

            txn.exec_params(
                R"(
                    INSERT INTO tokens (serial, type, active, owner_user, owner_realm,
                                        container_serial, bound_at, description, created_at)
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)
                    ON CONFLICT (serial) DO UPDATE SET
                        active = EXCLUDED.active,
                        owner_user = EXCLUDED.owner_user,
                        owner_realm = EXCLUDED.owner_realm,
                        container_serial = EXCLUDED.container_serial,
                        bound_at = EXCLUDED.bound_at,
                        description = EXCLUDED.description
                )",
                token.serial,
                domain::toString(token.type),
                token.active,
                ownerUser,
                ownerRealm,
                token.containerSerial,
                token.boundAt.toEpochMicros(),
                token.description,
                token.createdAt.toEpochMicros()
            );

            txn.exec_params("DELETE FROM token_info WHERE token_serial = $1", token.serial);
            for (const auto& [key, value] : token.info) {
                txn.exec_params(
                    "INSERT INTO token_info (token_serial, key, value) VALUES ($1, $2, $3)",
                    token.serial, key, value);
            }

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Token> findBySerial(const std::string& serial) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto tokens = load(txn, " WHERE serial = $1", "", serial);
            txn.commit();
            if (tokens.empty()) {
                return std::nullopt;
            }
            return tokens.front();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] findBySerial() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Token> findByContainer(const std::string& containerSerial) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto tokens = load(txn, " WHERE container_serial = $1", " ORDER BY bound_at, serial", containerSerial);
            txn.commit();
            return tokens;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] findByContainer() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Token> findAll() override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto tokens = load(txn, "", " ORDER BY serial");
            txn.commit();
            return tokens;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool exists(const std::string& serial) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto result = txn.exec_params("SELECT 1 FROM tokens WHERE serial = $1", serial);
            txn.commit();
            return !result.empty();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] exists() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool remove(const std::string& serial) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);
            auto result = txn.exec_params("DELETE FROM tokens WHERE serial = $1", serial);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] remove() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool detachAll(
        const std::string& containerSerial,
        const std::vector<std::string>& serials,
        bool deleteTokens
    ) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work txn(c);

            for (const auto& serial : serials) {
                auto row = txn.exec_params(
                    "SELECT container_serial FROM tokens WHERE serial = $1 FOR UPDATE", serial);
                if (row.empty() || row[0][0].is_null()
                    || row[0][0].as<std::string>() != containerSerial) {
                    std::cerr << "[PostgresTokenRepository] detachAll(): " << serial
                              << " is not bound to " << containerSerial << ", rolled back" << std::endl;
                    return false;
                }
            }

            for (const auto& serial : serials) {
                if (deleteTokens) {
                    txn.exec_params("DELETE FROM tokens WHERE serial = $1", serial);
                } else {
                    txn.exec_params("UPDATE tokens SET container_serial = NULL WHERE serial = $1", serial);
                }
            }

            txn.commit();
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] detachAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    inline static const std::string SELECT_TOKEN =
        "SELECT serial, type, active, owner_user, owner_realm, container_serial, bound_at, "
        "description, created_at FROM tokens";

    /**
     * @brief Токены по условию и их info
     *
     * info читается тем же условием через join, только для выбранных токенов.
     * Условие ссылается на колонки tokens, не пересекающиеся с token_info.
     */
    template<typename... Args>
    std::vector<domain::Token> load(
        pqxx::work& txn,
        const std::string& condition,
        const std::string& order,
        Args&&... args
    ) const {
        std::vector<domain::Token> tokens;
        std::map<std::string, size_t> index;
        for (const auto& row : txn.exec_params(SELECT_TOKEN + condition + order, args...)) {
            index[row["serial"].as<std::string>()] = tokens.size();
            tokens.push_back(rowToToken(row));
        }
        if (tokens.empty()) {
            return tokens;
        }

        auto info = txn.exec_params(
            "SELECT token_info.token_serial, token_info.key, token_info.value "
            "FROM token_info JOIN tokens ON tokens.serial = token_info.token_serial" + condition,
            args...);
        for (const auto& row : info) {
            auto it = index.find(row["token_serial"].as<std::string>());
            if (it != index.end()) {
                tokens[it->second].info[row["key"].as<std::string>()] = row["value"].as<std::string>();
            }
        }
        return tokens;
    }

    domain::Token rowToToken(const pqxx::row& row) const {
        domain::Token token;
        token.serial = row["serial"].as<std::string>();
        token.type = domain::tokenTypeFromString(row["type"].as<std::string>())
                         .value_or(domain::TokenType::HOTP);
        token.active = row["active"].as<bool>();
        if (!row["owner_user"].is_null()) {
            token.owner = domain::Owner(
                row["owner_user"].as<std::string>(),
                row["owner_realm"].is_null() ? "" : row["owner_realm"].as<std::string>());
        }
        if (!row["container_serial"].is_null()) {
            token.containerSerial = row["container_serial"].as<std::string>();
        }
        token.boundAt = domain::Timestamp::fromEpochMicros(row["bound_at"].as<int64_t>());
        token.description = row["description"].as<std::string>();
        token.createdAt = domain::Timestamp::fromEpochMicros(row["created_at"].as<int64_t>());
        return token;
    }
};

} // namespace containers::adapters::secondary
