#pragma once

#include <string>
#include <cstdlib>
#include <chrono>

namespace containers::settings {

/**
 * @brief Настройки регистрации устройств
 *
 * Читает из ENV:
 * - REGISTRATION_SERVER_URL (default: "https://localhost/")
 * - REGISTRATION_TTL_MINUTES (default: 10)
 * - REGISTRATION_GRACE_SECONDS (default: 0) - допуск на расхождение часов
 * - REGISTRATION_SSL_VERIFY (default: true)
 * - REGISTRATION_ISSUER (default: "privacyIDEA")
 */
class RegistrationSettings {
public:
    RegistrationSettings() {
        if (const char* url = std::getenv("REGISTRATION_SERVER_URL")) {
            serverUrl_ = url;
        }
        if (const char* ttl = std::getenv("REGISTRATION_TTL_MINUTES")) {
            ttlMinutes_ = std::stoi(ttl);
        }
        if (const char* grace = std::getenv("REGISTRATION_GRACE_SECONDS")) {
            graceSeconds_ = std::stoi(grace);
        }
        if (const char* verify = std::getenv("REGISTRATION_SSL_VERIFY")) {
            std::string v = verify;
            sslVerify_ = !(v == "false" || v == "False" || v == "0");
        }
        if (const char* issuer = std::getenv("REGISTRATION_ISSUER")) {
            issuer_ = issuer;
        }
    }

    RegistrationSettings(std::string serverUrl, int ttlMinutes, int graceSeconds,
                         bool sslVerify = true, std::string issuer = "privacyIDEA")
        : serverUrl_(std::move(serverUrl))
        , ttlMinutes_(ttlMinutes)
        , graceSeconds_(graceSeconds)
        , sslVerify_(sslVerify)
        , issuer_(std::move(issuer)) {}

    std::string getServerUrl() const { return serverUrl_; }
    int getTtlMinutes() const { return ttlMinutes_; }
    std::chrono::seconds getTtl() const { return std::chrono::seconds(ttlMinutes_ * 60); }
    std::chrono::seconds getGrace() const { return std::chrono::seconds(graceSeconds_); }
    bool getSslVerify() const { return sslVerify_; }
    std::string getIssuer() const { return issuer_; }

private:
    std::string serverUrl_ = "https://localhost/";
    int ttlMinutes_ = 10;
    int graceSeconds_ = 0;
    bool sslVerify_ = true;
    std::string issuer_ = "privacyIDEA";
};

} // namespace containers::settings
