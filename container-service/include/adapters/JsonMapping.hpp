#pragma once

#include "domain/Container.hpp"
#include "domain/Token.hpp"
#include "domain/ContainerTemplate.hpp"
#include "domain/RegistrationChallenge.hpp"
#include "domain/BatchResult.hpp"
#include "domain/ContainerError.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>
#include <map>

namespace containers::adapters::json {

using nlohmann::json;

inline json ownerToJson(const std::optional<domain::Owner>& owner) {
    json users = json::array();
    if (owner) {
        users.push_back({{"user_name", owner->user}, {"user_realm", owner->realm}});
    }
    return users;
}

inline json containerToJson(const domain::Container& container) {
    json j;
    j["serial"] = container.serial;
    j["type"] = domain::toString(container.type);
    j["description"] = container.description;
    j["users"] = ownerToJson(container.owner);
    j["realms"] = container.realms;
    j["tokens"] = container.tokenSerials;
    j["states"] = container.stateNames();
    j["info"] = container.info;
    j["template"] = container.templateName.value_or("");
    j["registration_state"] = domain::toString(container.registrationState);
    j["created_at"] = container.createdAt.toString();
    j["last_authentication"] = container.lastAuthentication
        ? json(container.lastAuthentication->toString()) : json(nullptr);
    j["last_synchronization"] = container.lastSynchronization
        ? json(container.lastSynchronization->toString()) : json(nullptr);
    return j;
}

inline json tokenToJson(const domain::Token& token) {
    json j;
    j["serial"] = token.serial;
    j["tokentype"] = domain::toString(token.type);
    j["active"] = token.active;
    j["users"] = ownerToJson(token.owner);
    j["container_serial"] = token.containerSerial.value_or("");
    j["description"] = token.description;
    j["info"] = token.info;
    return j;
}

/**
 * @brief Настройки токена: нестроковые значения JSON сохраняются как их текст
 */
inline std::map<std::string, std::string> settingsFromJson(const json& j) {
    std::map<std::string, std::string> settings;
    if (!j.is_object()) {
        return settings;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        settings[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
    return settings;
}

inline json tokenSpecToJson(const domain::TokenSpec& spec) {
    return {
        {"type", domain::toString(spec.type)},
        {"count", spec.count},
        {"settings", spec.settings},
        {"default", spec.selected},
        {"diff", spec.diffMarked}
    };
}

/**
 * @throws domain::ContainerError INVALID_PARAMETER для неизвестного типа токена
 * @throws nlohmann::json::exception для поля неверного JSON типа
 */
inline domain::TokenSpec tokenSpecFromJson(const json& j) {
    domain::TokenSpec spec;
    std::string type = j.at("type").get<std::string>();
    auto tokenType = domain::tokenTypeFromString(type);
    if (!tokenType) {
        throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Unknown token type: " + type);
    }
    spec.type = *tokenType;
    if (j.contains("count")) {
        const auto& count = j["count"];
        if (!count.is_number_integer()) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "count must be an integer");
        }
        constexpr auto maxCount = domain::TokenSpec::MAX_COUNT;
        bool inRange = count.is_number_unsigned()
            ? count.get<uint64_t>() >= 1 && count.get<uint64_t>() <= static_cast<uint64_t>(maxCount)
            : count.get<int64_t>() >= 1 && count.get<int64_t>() <= maxCount;
        if (!inRange) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER,
                "count must be between 1 and " + std::to_string(maxCount));
        }
        spec.count = count.get<int>();
    }
    if (j.contains("settings")) {
        spec.settings = settingsFromJson(j["settings"]);
    }
    spec.selected = j.value("default", true);
    spec.diffMarked = j.value("diff", true);
    return spec;
}

inline json tokenSpecsToJson(const std::vector<domain::TokenSpec>& specs) {
    json array = json::array();
    for (const auto& spec : specs) {
        array.push_back(tokenSpecToJson(spec));
    }
    return array;
}

inline std::vector<domain::TokenSpec> tokenSpecsFromJson(const json& j) {
    std::vector<domain::TokenSpec> specs;
    if (!j.is_array()) {
        throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "tokens must be an array");
    }
    for (const auto& item : j) {
        specs.push_back(tokenSpecFromJson(item));
    }
    return specs;
}

inline json templateToJson(const domain::ContainerTemplate& tmpl) {
    return {
        {"name", tmpl.name},
        {"container_type", domain::toString(tmpl.containerType)},
        {"default", tmpl.isDefault},
        {"tokens", tokenSpecsToJson(tmpl.tokens)}
    };
}

/**
 * @param name Имя из пути запроса, перекрывает поле "name" тела
 */
inline domain::ContainerTemplate templateFromJson(const json& j, const std::string& name = "") {
    domain::ContainerTemplate tmpl;
    tmpl.name = name.empty() ? j.value("name", "") : name;

    std::string type = j.value("container_type", "");
    auto containerType = domain::containerTypeFromString(type);
    if (!containerType) {
        throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Unknown container type: " + type);
    }
    tmpl.containerType = *containerType;
    tmpl.isDefault = j.value("default", false);
    if (j.contains("tokens")) {
        tmpl.tokens = tokenSpecsFromJson(j["tokens"]);
    }
    return tmpl;
}

inline json diffToJson(const domain::TemplateDiff& diff) {
    return {
        {"added", diff.added},
        {"removed", diff.removed},
        {"matching", diff.matching},
        {"equal", diff.isEmpty()}
    };
}

inline json batchToJson(const domain::BatchResult& batch) {
    json results = json::array();
    for (const auto& item : batch.items) {
        results.push_back({{"serial", item.serial}, {"success", item.success}, {"message", item.message}});
    }
    json j;
    j["results"] = results;
    j["success"] = batch.allSucceeded();
    if (!batch.note.empty()) {
        j["note"] = batch.note;
    }
    return j;
}

inline json offerToJson(const domain::RegistrationOffer& offer) {
    json j;
    j["container_serial"] = offer.containerSerial;
    j["container_url"] = {
        {"description", "URL for container registration"},
        {"value", offer.url}
    };
    j["nonce"] = offer.nonce;
    j["time_stamp"] = offer.timeStamp;
    j["key_algorithm"] = offer.keyAlgorithm;
    j["hash_algorithm"] = offer.hashAlgorithm;
    j["ssl_verify"] = offer.sslVerify;
    j["ttl"] = offer.ttlMinutes;
    j["passphrase_prompt"] = offer.passphrasePrompt;
    j["server_url"] = offer.serverUrl;
    return j;
}

} // namespace containers::adapters::json
