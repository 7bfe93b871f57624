#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IContainerService.hpp"
#include "ports/input/IBulkOperationService.hpp"
#include "settings/ContainerSettings.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "adapters/JsonMapping.hpp"
#include "utils/StringUtils.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace containers::adapters::primary {

/**
 * @brief HTTP Handler реестра контейнеров
 *
 * Endpoints:
 * - GET    /container                       → список с фильтрами и пагинацией
 * - POST   /container/init                  → создать контейнер (опционально из шаблона)
 * - GET    /container/{serial}              → контейнер
 * - DELETE /container/{serial}              → удалить (?cascade=1&delete_tokens=1)
 * - POST   /container/{serial}/add|remove   → привязать / отвязать токен
 * - POST   /container/{serial}/removeall    → отвязать список токенов (все или ни одного)
 * - POST   /container/{serial}/states       → состояния (add=1: добавить к текущим)
 * - POST   /container/{serial}/realms       → realm'ы (add=1: добавить к текущим)
 * - POST   /container/{serial}/lastseen     → отметить authentication | synchronization
 * - POST   /container/{serial}/description  → описание
 * - POST   /container/{serial}/assign|unassign → владелец
 * - POST   /container/{serial}/toggleall    → activate/deactivate/remove для всех токенов
 * - POST   /container/{serial}/info/{key}   → записать info
 * - DELETE /container/{serial}/info/{key}   → удалить info
 *
 * Требует bearer токен (проверяется middleware до этого handler'а).
 */
class ContainerHandler : public IHttpHandler
{
public:
    ContainerHandler(
        std::shared_ptr<ports::input::IContainerService> containerService,
        std::shared_ptr<ports::input::IBulkOperationService> bulkService,
        std::shared_ptr<settings::ContainerSettings> settings
    ) : containerService_(std::move(containerService))
      , bulkService_(std::move(bulkService))
      , settings_(std::move(settings))
    {
        std::cout << "[ContainerHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        respondGuarded(res, "ContainerHandler", [&]() { route(req, res); });
    }

private:
    std::shared_ptr<ports::input::IContainerService> containerService_;
    std::shared_ptr<ports::input::IBulkOperationService> bulkService_;
    std::shared_ptr<settings::ContainerSettings> settings_;

    void route(IRequest& req, IResponse& res)
    {
        std::string method = req.getMethod();
        auto segments = utils::pathSegments(req.getPath());

        if (segments.empty() || segments[0] != "container") {
            sendError(res, 404, "Not found");
            return;
        }

        if (segments.size() == 1 && method == "GET") {
            handleList(req, res);
        } else if (segments.size() == 2 && segments[1] == "init" && method == "POST") {
            handleInit(req, res);
        } else if (segments.size() == 2 && method == "GET") {
            sendJson(res, 200, json::containerToJson(containerService_->getContainer(segments[1])));
        } else if (segments.size() == 2 && method == "DELETE") {
            handleDelete(req, res, segments[1]);
        } else if (segments.size() == 3 && method == "POST") {
            handleAction(req, res, segments[1], segments[2]);
        } else if (segments.size() == 4 && segments[2] == "info") {
            handleInfo(req, res, method, segments[1], segments[3]);
        } else {
            sendError(res, 404, "Not found");
        }
    }

    void handleList(IRequest& req, IResponse& res)
    {
        domain::ContainerQuery query;
        query.serial = nonEmptyParam(req, "container_serial");
        query.type = nonEmptyParam(req, "type");
        query.user = nonEmptyParam(req, "user");
        query.realm = nonEmptyParam(req, "realm");
        query.description = nonEmptyParam(req, "description");
        query.tokenSerial = nonEmptyParam(req, "token_serial");
        query.templateName = nonEmptyParam(req, "template");

        query.sortBy = req.getQueryParam("sortby").value_or("serial");
        query.sortDescending = req.getQueryParam("sortdir").value_or("asc") == "desc";
        query.page = intParam(req, "page", 1);
        query.pageSize = intParam(req, "pagesize", settings_->getPageSize());

        auto page = containerService_->listContainers(query);

        nlohmann::json response;
        response["containers"] = nlohmann::json::array();
        for (const auto& container : page.containers) {
            response["containers"].push_back(json::containerToJson(container));
        }
        response["count"] = page.count;
        response["current"] = page.current;
        response["prev"] = page.prev ? nlohmann::json(*page.prev) : nlohmann::json(nullptr);
        response["next"] = page.next ? nlohmann::json(*page.next) : nlohmann::json(nullptr);

        sendJson(res, 200, response);
    }

    void handleInit(IRequest& req, IResponse& res)
    {
        auto body = parseBody(req);

        ports::input::CreateContainerRequest request;
        request.type = body.value("type", "");
        request.description = body.value("description", "");
        request.owner = ownerFromBody(body);
        std::string templateName = body.value("template", "");
        if (!templateName.empty()) {
            request.templateName = templateName;
        }

        auto result = containerService_->createContainer(request);

        nlohmann::json response;
        response["container_serial"] = result.serial;
        response["tokens"] = json::batchToJson(result.tokens);
        sendJson(res, 201, response);
    }

    void handleDelete(IRequest& req, IResponse& res, const std::string& serial)
    {
        bool cascade = utils::parseFlag(req.getQueryParam("cascade").value_or(""));
        bool deleteTokens = utils::parseFlag(req.getQueryParam("delete_tokens").value_or(""));

        containerService_->deleteContainer(serial, cascade, deleteTokens);
        sendJson(res, 200, {{"result", true}});
    }

    void handleAction(IRequest& req, IResponse& res, const std::string& serial, const std::string& action)
    {
        auto body = parseBody(req);

        if (action == "add") {
            bool added = containerService_->addToken(serial, requireString(body, "serial"), flag(body, "force"));
            sendJson(res, 200, {{"result", added}});
        } else if (action == "remove") {
            bool removed = containerService_->removeToken(serial, requireString(body, "serial"));
            sendJson(res, 200, {{"result", removed}});
        } else if (action == "removeall") {
            auto serials = utils::splitList(requireString(body, "serial"));
            auto batch = bulkService_->removeTokens(serial, serials, flag(body, "delete"));
            sendJson(res, 200, json::batchToJson(batch));
        } else if (action == "states") {
            auto states = utils::splitList(body.value("states", ""));
            auto result = flag(body, "add")
                ? containerService_->addStates(serial, states)
                : containerService_->setStates(serial, states);
            sendJson(res, 200, {{"result", result}});
        } else if (action == "realms") {
            auto realms = utils::splitList(body.value("realms", ""));
            if (flag(body, "add")) {
                nlohmann::json result = containerService_->addRealms(serial, realms);
                result["deleted"] = false;
                sendJson(res, 200, {{"result", result}, {"realms", containerService_->getContainer(serial).realms}});
            } else {
                auto assigned = containerService_->setRealms(serial, realms);
                sendJson(res, 200, {{"result", true}, {"realms", assigned}});
            }
        } else if (action == "lastseen") {
            auto event = requireString(body, "type");
            if (event == "authentication") {
                containerService_->recordAuthentication(serial);
            } else if (event == "synchronization") {
                containerService_->recordSynchronization(serial);
            } else {
                throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Unknown event type: " + event);
            }
            sendJson(res, 200, {{"result", true}});
        } else if (action == "description") {
            containerService_->setDescription(serial, body.value("description", ""));
            sendJson(res, 200, {{"result", true}});
        } else if (action == "assign") {
            auto owner = ownerFromBody(body);
            if (!owner) {
                throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Missing parameter: user");
            }
            containerService_->assignUser(serial, *owner, flag(body, "force"));
            sendJson(res, 200, {{"result", true}});
        } else if (action == "unassign") {
            domain::Owner owner(requireString(body, "user"), body.value("realm", ""));
            sendJson(res, 200, {{"result", containerService_->unassignUser(serial, owner)}});
        } else if (action == "toggleall") {
            auto batch = bulkService_->bulkAction(serial, requireString(body, "action"));
            sendJson(res, 200, json::batchToJson(batch));
        } else {
            sendError(res, 404, "Not found");
        }
    }

    void handleInfo(IRequest& req, IResponse& res, const std::string& method,
                    const std::string& serial, const std::string& key)
    {
        if (method == "POST") {
            auto body = parseBody(req);
            containerService_->setInfo(serial, key, requireString(body, "value"));
            sendJson(res, 200, {{"result", true}});
        } else if (method == "DELETE") {
            sendJson(res, 200, {{"result", containerService_->deleteInfo(serial, key)}});
        } else {
            sendError(res, 405, "Method not allowed");
        }
    }

    static std::optional<domain::Owner> ownerFromBody(const nlohmann::json& body)
    {
        std::string user = body.value("user", "");
        if (user.empty()) {
            return std::nullopt;
        }
        return domain::Owner(user, body.value("realm", ""));
    }

    static std::string requireString(const nlohmann::json& body, const std::string& key)
    {
        std::string value = body.value(key, "");
        if (value.empty()) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Missing parameter: " + key);
        }
        return value;
    }

    /**
     * @brief Флаг из тела: true/false или строка "1"/"true"
     */
    static bool flag(const nlohmann::json& body, const std::string& key)
    {
        if (!body.contains(key)) {
            return false;
        }
        const auto& value = body[key];
        if (value.is_boolean()) {
            return value.get<bool>();
        }
        if (value.is_number_integer()) {
            return value.get<int>() != 0;
        }
        return value.is_string() && utils::parseFlag(value.get<std::string>());
    }

    static std::optional<std::string> nonEmptyParam(IRequest& req, const std::string& name)
    {
        auto value = req.getQueryParam(name);
        if (value && value->empty()) {
            return std::nullopt;
        }
        return value;
    }

    static int intParam(IRequest& req, const std::string& name, int defaultValue)
    {
        auto value = req.getQueryParam(name);
        if (!value || value->empty()) {
            return defaultValue;
        }
        try {
            return std::stoi(*value);
        } catch (const std::logic_error&) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Invalid integer parameter: " + name);
        }
    }
};

} // namespace containers::adapters::primary
