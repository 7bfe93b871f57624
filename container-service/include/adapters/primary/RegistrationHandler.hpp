#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IRegistrationService.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "adapters/JsonMapping.hpp"
#include "utils/StringUtils.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace containers::adapters::primary {

/**
 * @brief HTTP Handler регистрации устройства (администраторская часть)
 *
 * Endpoints:
 * - POST /container/register/initialize        → выпустить challenge и URL для QR кода
 * - POST /container/register/{serial}/terminate → сбросить регистрацию
 * - GET  /container/register/{serial}          → текущее состояние регистрации
 *
 * finalize обрабатывает RegistrationFinalizeHandler: его вызывает само устройство без bearer токена.
 */
class RegistrationHandler : public IHttpHandler
{
public:
    explicit RegistrationHandler(std::shared_ptr<ports::input::IRegistrationService> registrationService)
        : registrationService_(std::move(registrationService))
    {
        std::cout << "[RegistrationHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        respondGuarded(res, "RegistrationHandler", [&]() { route(req, res); });
    }

private:
    std::shared_ptr<ports::input::IRegistrationService> registrationService_;

    void route(IRequest& req, IResponse& res)
    {
        std::string method = req.getMethod();
        auto segments = utils::pathSegments(req.getPath());

        if (segments.size() < 3 || segments[0] != "container" || segments[1] != "register") {
            sendError(res, 404, "Not found");
            return;
        }

        if (segments.size() == 3 && segments[2] == "initialize" && method == "POST") {
            handleInitialize(req, res);
        } else if (segments.size() == 4 && segments[3] == "terminate" && method == "POST") {
            registrationService_->terminateRegistration(segments[2]);
            sendJson(res, 200, {{"result", true}});
        } else if (segments.size() == 3 && method == "GET") {
            auto state = registrationService_->getRegistrationState(segments[2]);
            sendJson(res, 200, {
                {"container_serial", segments[2]},
                {"registration_state", domain::toString(state)}
            });
        } else {
            sendError(res, 404, "Not found");
        }
    }

    void handleInitialize(IRequest& req, IResponse& res)
    {
        auto body = parseBody(req);

        std::string serial = body.value("container_serial", "");
        if (serial.empty()) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Missing parameter: container_serial");
        }

        std::optional<std::string> prompt;
        std::optional<std::string> passphrase;
        if (body.contains("passphrase_prompt")) {
            prompt = body["passphrase_prompt"].get<std::string>();
        }
        if (body.contains("passphrase_response")) {
            passphrase = body["passphrase_response"].get<std::string>();
        }

        auto offer = registrationService_->beginRegistration(serial, prompt, passphrase);
        sendJson(res, 200, json::offerToJson(offer));
    }
};

/**
 * @brief POST /container/register/finalize: ответ устройства на challenge
 *
 * Без bearer токена: устройство подтверждает себя nonce'ом из QR кода.
 * Любой отказ отдаётся одинаково (403 INVALID_OR_EXPIRED_CHALLENGE).
 */
class RegistrationFinalizeHandler : public IHttpHandler
{
public:
    explicit RegistrationFinalizeHandler(std::shared_ptr<ports::input::IRegistrationService> registrationService)
        : registrationService_(std::move(registrationService))
    {
        std::cout << "[RegistrationFinalizeHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        respondGuarded(res, "RegistrationFinalizeHandler", [&]() {
            auto body = parseBody(req);

            std::string serial = body.value("container_serial", "");
            std::optional<std::string> passphrase;
            if (body.contains("passphrase")) {
                passphrase = body["passphrase"].get<std::string>();
            }

            domain::DeviceInfo device;
            device.brand = body.value("device_brand", "");
            device.model = body.value("device_model", "");
            device.publicKey = body.value("public_client_key", "");

            registrationService_->completeRegistration(serial, body.value("nonce", ""), passphrase, device);

            sendJson(res, 200, {
                {"result", true},
                {"container_serial", serial},
                {"registration_state", domain::toString(domain::RegistrationState::REGISTERED)}
            });
        });
    }

private:
    std::shared_ptr<ports::input::IRegistrationService> registrationService_;
};

} // namespace containers::adapters::primary
