#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/ITokenRegistry.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "adapters/JsonMapping.hpp"
#include "utils/StringUtils.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace containers::adapters::primary {

/**
 * @brief HTTP Handler реестра токенов
 *
 * Endpoints:
 * - POST   /token/init            → выпустить токен {type, user, realm, settings}
 * - GET    /token                 → список (?serial=, ?container_serial=)
 * - POST   /token/enable|disable  → активировать / деактивировать {serial}
 * - DELETE /token/{serial}        → удалить токен
 */
class TokenHandler : public IHttpHandler
{
public:
    explicit TokenHandler(std::shared_ptr<ports::input::ITokenRegistry> tokenRegistry)
        : tokenRegistry_(std::move(tokenRegistry))
    {
        std::cout << "[TokenHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        respondGuarded(res, "TokenHandler", [&]() { route(req, res); });
    }

private:
    std::shared_ptr<ports::input::ITokenRegistry> tokenRegistry_;

    void route(IRequest& req, IResponse& res)
    {
        std::string method = req.getMethod();
        auto segments = utils::pathSegments(req.getPath());

        if (segments.empty() || segments[0] != "token") {
            sendError(res, 404, "Not found");
            return;
        }

        if (segments.size() == 1 && method == "GET") {
            handleList(req, res);
        } else if (segments.size() == 2 && segments[1] == "init" && method == "POST") {
            handleInit(req, res);
        } else if (segments.size() == 2 && (segments[1] == "enable" || segments[1] == "disable") && method == "POST") {
            auto body = parseBody(req);
            std::string serial = body.value("serial", "");
            if (serial.empty()) {
                throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Missing parameter: serial");
            }
            bool changed = tokenRegistry_->setActive(serial, segments[1] == "enable");
            sendJson(res, 200, {{"result", changed}});
        } else if (segments.size() == 2 && method == "DELETE") {
            if (!tokenRegistry_->remove(segments[1])) {
                throw domain::ContainerError::notFound("Token " + segments[1]);
            }
            sendJson(res, 200, {{"result", true}});
        } else {
            sendError(res, 404, "Not found");
        }
    }

    void handleInit(IRequest& req, IResponse& res)
    {
        auto body = parseBody(req);

        std::optional<domain::Owner> owner;
        std::string user = body.value("user", "");
        if (!user.empty()) {
            owner = domain::Owner(user, body.value("realm", ""));
        }

        std::map<std::string, std::string> settings;
        if (body.contains("settings")) {
            settings = json::settingsFromJson(body["settings"]);
        }

        auto result = tokenRegistry_->provision(body.value("type", ""), settings, owner);
        if (!result.success) {
            throw domain::ContainerError(domain::ErrorCode::PROVISIONING_ERROR, result.message);
        }

        sendJson(res, 201, {{"serial", result.serial}, {"result", true}});
    }

    void handleList(IRequest& req, IResponse& res)
    {
        std::string serial = req.getQueryParam("serial").value_or("");
        std::string containerSerial = req.getQueryParam("container_serial").value_or("");

        std::vector<domain::Token> tokens;
        if (!serial.empty()) {
            if (auto token = tokenRegistry_->find(serial)) {
                tokens.push_back(*token);
            }
        } else if (!containerSerial.empty()) {
            tokens = tokenRegistry_->findByContainer(containerSerial);
        } else {
            tokens = tokenRegistry_->list();
        }

        nlohmann::json response;
        response["tokens"] = nlohmann::json::array();
        for (const auto& token : tokens) {
            if (!containerSerial.empty() && token.containerSerial.value_or("") != containerSerial) {
                continue;
            }
            response["tokens"].push_back(json::tokenToJson(token));
        }
        response["count"] = response["tokens"].size();

        sendJson(res, 200, response);
    }
};

} // namespace containers::adapters::primary
