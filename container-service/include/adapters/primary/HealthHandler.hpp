#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include "ports/output/IContainerRepository.hpp"
#include "settings/ContainerSettings.hpp"

#include <memory>
#include <iostream>

namespace containers::adapters::primary {

/**
 * @brief GET /health
 *
 * Проверяет доступность хранилища контейнеров: 200 "healthy" или 503 "degraded".
 */
class HealthHandler : public IHttpHandler {
public:
    HealthHandler(
        std::shared_ptr<ports::output::IContainerRepository> containerRepo,
        std::shared_ptr<settings::ContainerSettings> settings
    ) : containerRepo_(std::move(containerRepo))
      , settings_(std::move(settings))
    {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["service"] = "container-service";
        response["version"] = "1.0.0";
        response["storage"] = settings_->getStorage();

        int status = 200;
        try {
            containerRepo_->exists("health-check");
            response["status"] = "healthy";
        } catch (const std::exception& e) {
            std::cerr << "[HealthHandler] Storage check failed: " << e.what() << std::endl;
            response["status"] = "degraded";
            response["error"] = e.what();
            status = 503;
        }

        res.setResult(status, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::output::IContainerRepository> containerRepo_;
    std::shared_ptr<settings::ContainerSettings> settings_;
};

} // namespace containers::adapters::primary
