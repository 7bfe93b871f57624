#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/ITemplateService.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "adapters/JsonMapping.hpp"
#include "utils/StringUtils.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace containers::adapters::primary {

/**
 * @brief HTTP Handler шаблонов контейнеров
 *
 * Endpoints:
 * - GET    /container/templates[?container_type=]   → список
 * - POST   /container/templates                     → создать
 * - GET    /container/templates/export              → выгрузка всех шаблонов
 * - POST   /container/templates/import              → загрузка ({templates, overwrite})
 * - GET    /container/templates/{name}              → шаблон
 * - POST   /container/templates/{name}              → создать или обновить
 * - DELETE /container/templates/{name}              → удалить
 * - GET    /container/templates/{name}/compare      → diff с контейнерами (?container_serial=)
 *
 * Имена "export" и "import" зарезервированы под выгрузку/загрузку.
 */
class TemplateHandler : public IHttpHandler
{
public:
    explicit TemplateHandler(std::shared_ptr<ports::input::ITemplateService> templateService)
        : templateService_(std::move(templateService))
    {
        std::cout << "[TemplateHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        respondGuarded(res, "TemplateHandler", [&]() { route(req, res); });
    }

private:
    std::shared_ptr<ports::input::ITemplateService> templateService_;

    void route(IRequest& req, IResponse& res)
    {
        std::string method = req.getMethod();
        auto segments = utils::pathSegments(req.getPath());

        if (segments.size() < 2 || segments[0] != "container" || segments[1] != "templates") {
            sendError(res, 404, "Not found");
            return;
        }

        if (segments.size() == 2) {
            if (method == "GET") {
                handleList(req, res);
            } else if (method == "POST") {
                auto tmpl = templateService_->createTemplate(json::templateFromJson(parseBody(req)));
                sendJson(res, 201, json::templateToJson(tmpl));
            } else {
                sendError(res, 405, "Method not allowed");
            }
            return;
        }

        const std::string& name = segments[2];

        if (segments.size() == 3 && name == "export" && method == "GET") {
            sendJson(res, 200, {{"templates", templatesToJson(templateService_->exportTemplates())}});
        } else if (segments.size() == 3 && name == "import" && method == "POST") {
            handleImport(req, res);
        } else if (segments.size() == 3 && method == "GET") {
            auto tmpl = templateService_->getTemplate(name);
            if (!tmpl) {
                throw domain::ContainerError::notFound("Template " + name);
            }
            sendJson(res, 200, json::templateToJson(*tmpl));
        } else if (segments.size() == 3 && method == "POST") {
            handleSave(req, res, name);
        } else if (segments.size() == 3 && method == "DELETE") {
            if (!templateService_->deleteTemplate(name)) {
                throw domain::ContainerError::notFound("Template " + name);
            }
            sendJson(res, 200, {{"result", true}});
        } else if (segments.size() == 4 && segments[3] == "compare" && method == "GET") {
            handleCompare(req, res, name);
        } else {
            sendError(res, 404, "Not found");
        }
    }

    void handleList(IRequest& req, IResponse& res)
    {
        std::optional<domain::ContainerType> type;
        std::string typeName = req.getQueryParam("container_type").value_or("");
        if (!typeName.empty()) {
            type = domain::containerTypeFromString(typeName);
            if (!type) {
                throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Unknown container type: " + typeName);
            }
        }
        sendJson(res, 200, {{"templates", templatesToJson(templateService_->listTemplates(type))}});
    }

    /**
     * @brief POST с именем в пути: обновить существующий шаблон или создать новый
     */
    void handleSave(IRequest& req, IResponse& res, const std::string& name)
    {
        auto tmpl = json::templateFromJson(parseBody(req), name);
        if (templateService_->getTemplate(name)) {
            sendJson(res, 200, json::templateToJson(templateService_->updateTemplate(tmpl)));
        } else {
            sendJson(res, 201, json::templateToJson(templateService_->createTemplate(tmpl)));
        }
    }

    void handleImport(IRequest& req, IResponse& res)
    {
        auto body = parseBody(req);
        if (!body.contains("templates") || !body["templates"].is_array()) {
            throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "templates must be an array");
        }

        std::vector<domain::ContainerTemplate> templates;
        for (const auto& item : body["templates"]) {
            templates.push_back(json::templateFromJson(item));
        }

        bool overwrite = body.value("overwrite", false);
        sendJson(res, 200, json::batchToJson(templateService_->importTemplates(templates, overwrite)));
    }

    void handleCompare(IRequest& req, IResponse& res, const std::string& name)
    {
        nlohmann::json result = nlohmann::json::object();

        std::string containerSerial = req.getQueryParam("container_serial").value_or("");
        if (!containerSerial.empty()) {
            result[containerSerial] = json::diffToJson(templateService_->diff(name, containerSerial));
        } else {
            for (const auto& [serial, diff] : templateService_->compareAll(name)) {
                result[serial] = json::diffToJson(diff);
            }
        }

        sendJson(res, 200, {{"result", result}});
    }

    static nlohmann::json templatesToJson(const std::vector<domain::ContainerTemplate>& templates)
    {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& tmpl : templates) {
            array.push_back(json::templateToJson(tmpl));
        }
        return array;
    }
};

} // namespace containers::adapters::primary
