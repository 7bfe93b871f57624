#pragma once

#include "ports/output/IAuthClient.hpp"
#include "settings/AuthClientSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace containers::adapters::secondary {

/**
 * @brief Проверка bearer токена администратора во внешнем Auth Service
 *
 * POST {validatePath} {"token", "type": "access"} -> {"valid", "user_id", "message"}.
 * Недоступность Auth Service означает отказ в доступе, а не ошибку сервиса.
 */
class HttpAuthClient : public ports::output::IAuthClient {
public:
    HttpAuthClient(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::AuthClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpAuthClient] Created, validating at " << settings_->getHost() << ":"
                  << settings_->getPort() << settings_->getValidatePath() << std::endl;
    }

    ports::output::TokenValidationResult validateAccessToken(const std::string& token) override {
        nlohmann::json payload = {{"token", token}, {"type", "access"}};
        SimpleRequest request(
            "POST",
            settings_->getValidatePath(),
            payload.dump(),
            settings_->getHost(),
            settings_->getPort(),
            {{"Content-Type", "application/json"}}
        );
        SimpleResponse response;

        try {
            httpClient_->send(request, response);
            if (response.getStatus() != 200) {
                std::cerr << "[HttpAuthClient] Auth service answered " << response.getStatus() << std::endl;
                return rejected("Auth service returned " + std::to_string(response.getStatus()));
            }
            return fromBody(nlohmann::json::parse(response.getBody()));
        } catch (const std::exception& e) {
            std::cerr << "[HttpAuthClient] Auth service unavailable: " << e.what() << std::endl;
            return rejected(std::string("Auth service error: ") + e.what());
        }
    }

    std::optional<std::string> getUserIdFromToken(const std::string& token) override {
        auto result = validateAccessToken(token);
        if (!result.valid || result.userId.empty()) {
            return std::nullopt;
        }
        return result.userId;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::AuthClientSettings> settings_;

    static ports::output::TokenValidationResult fromBody(const nlohmann::json& body) {
        ports::output::TokenValidationResult result;
        result.valid = body.value("valid", false);
        result.userId = body.value("user_id", "");
        result.message = body.value("message", "");
        return result;
    }

    static ports::output::TokenValidationResult rejected(const std::string& message) {
        ports::output::TokenValidationResult result;
        result.message = message;
        return result;
    }
};

} // namespace containers::adapters::secondary
