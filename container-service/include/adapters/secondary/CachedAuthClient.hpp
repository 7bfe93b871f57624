#pragma once

#include "ports/output/IAuthClient.hpp"
#include "adapters/secondary/HttpAuthClient.hpp"
#include "settings/AuthClientSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <chrono>
#include <memory>
#include <iostream>

namespace containers::adapters::secondary {

/**
 * @brief Декоратор IAuthClient с LRU кэшем подтверждённых токенов
 *
 * Кэш: bearer token -> user_id. Отказы не кэшируются,
 * поэтому только что выданный токен принимается сразу.
 * Отозванный токен может приниматься ещё до AUTH_CACHE_TTL_SECONDS.
 */
class CachedAuthClient : public ports::output::IAuthClient {
public:
    CachedAuthClient(
        std::shared_ptr<HttpAuthClient> delegate,
        std::shared_ptr<settings::AuthClientSettings> settings
    ) : delegate_(std::move(delegate))
      , settings_(std::move(settings))
    {
        if (settings_->isCacheEnabled()) {
            auto base = std::make_unique<Cache<std::string, std::string>>(
                settings_->getCacheSize(),
                std::make_unique<LRUPolicy<std::string>>(),
                std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(settings_->getCacheTtlSeconds()))
            );
            userIds_ = std::make_unique<ThreadSafeCache<std::string, std::string>>(std::move(base));
        }

        std::cout << "[CachedAuthClient] Created, cache="
                  << (userIds_ ? std::to_string(settings_->getCacheSize()) + "/"
                                 + std::to_string(settings_->getCacheTtlSeconds()) + "s"
                               : std::string("off"))
                  << std::endl;
    }

    ports::output::TokenValidationResult validateAccessToken(const std::string& token) override {
        if (userIds_) {
            if (auto cached = userIds_->get(token)) {
                ports::output::TokenValidationResult result;
                result.valid = true;
                result.userId = *cached;
                result.message = "OK";
                return result;
            }
        }

        auto result = delegate_->validateAccessToken(token);
        if (userIds_ && result.valid && !result.userId.empty()) {
            userIds_->put(token, result.userId);
        }
        return result;
    }

    std::optional<std::string> getUserIdFromToken(const std::string& token) override {
        auto result = validateAccessToken(token);
        if (!result.valid || result.userId.empty()) {
            return std::nullopt;
        }
        return result.userId;
    }

    void clearCache() {
        if (userIds_) {
            userIds_->clear();
        }
    }

    size_t getCacheSize() const {
        return userIds_ ? userIds_->size() : 0;
    }

private:
    std::shared_ptr<HttpAuthClient> delegate_;
    std::shared_ptr<settings::AuthClientSettings> settings_;
    std::unique_ptr<ICache<std::string, std::string>> userIds_;
};

} // namespace containers::adapters::secondary
