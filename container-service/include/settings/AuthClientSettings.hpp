#pragma once

#include <string>
#include <cstdlib>
#include <cstddef>

namespace containers::settings {

/**
 * @brief Настройки проверки bearer токенов администратора
 *
 * Читает из ENV:
 * - AUTH_SERVICE_HOST (default: "auth-service")
 * - AUTH_SERVICE_PORT (default: 8080)
 * - AUTH_VALIDATE_PATH (default: "/api/v1/auth/validate")
 * - AUTH_CACHE_SIZE (default: 1000) - сколько подтверждённых токенов помнить
 * - AUTH_CACHE_TTL_SECONDS (default: 30) - 0 отключает кэш
 */
class AuthClientSettings {
public:
    AuthClientSettings() {
        if (const char* host = std::getenv("AUTH_SERVICE_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("AUTH_SERVICE_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* path = std::getenv("AUTH_VALIDATE_PATH")) {
            validatePath_ = path;
        }
        if (const char* size = std::getenv("AUTH_CACHE_SIZE")) {
            cacheSize_ = static_cast<size_t>(std::stoul(size));
        }
        if (const char* ttl = std::getenv("AUTH_CACHE_TTL_SECONDS")) {
            cacheTtlSeconds_ = std::stoi(ttl);
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getValidatePath() const { return validatePath_; }
    size_t getCacheSize() const { return cacheSize_; }
    int getCacheTtlSeconds() const { return cacheTtlSeconds_; }
    bool isCacheEnabled() const { return cacheSize_ > 0 && cacheTtlSeconds_ > 0; }

private:
    std::string host_ = "auth-service";
    int port_ = 8080;
    std::string validatePath_ = "/api/v1/auth/validate";
    size_t cacheSize_ = 1000;
    int cacheTtlSeconds_ = 30;
};

} // namespace containers::settings
