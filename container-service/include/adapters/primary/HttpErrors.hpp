#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/ContainerError.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

namespace containers::adapters::primary {

/**
 * @brief HTTP статус для доменной ошибки
 */
inline int httpStatusFor(domain::ErrorCode code) {
    switch (code) {
        case domain::ErrorCode::NOT_FOUND:
            return 404;
        case domain::ErrorCode::INVALID_OR_EXPIRED_CHALLENGE:
            return 403;
        case domain::ErrorCode::DUPLICATE_NAME:
        case domain::ErrorCode::OWNERSHIP_CONFLICT:
        case domain::ErrorCode::HAS_BOUND_TOKENS:
        case domain::ErrorCode::TEMPLATE_IN_USE:
        case domain::ErrorCode::REGISTRATION_PENDING:
            return 409;
        case domain::ErrorCode::TYPE_MISMATCH:
        case domain::ErrorCode::PROVISIONING_ERROR:
        case domain::ErrorCode::UNSUPPORTED_ACTION:
        case domain::ErrorCode::INVALID_PARAMETER:
            return 400;
    }
    return 500;
}

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setResult(status, "application/json", body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

inline void sendError(IResponse& res, const domain::ContainerError& e) {
    nlohmann::json error;
    error["error"] = e.what();
    error["code"] = domain::toString(e.code());
    res.setResult(httpStatusFor(e.code()), "application/json", error.dump());
}

/**
 * @brief Тело запроса как JSON; пустое тело считается пустым объектом
 * @throws nlohmann::json::exception при невалидном JSON
 */
inline nlohmann::json parseBody(IRequest& req) {
    std::string body = req.getBody();
    if (body.empty()) {
        return nlohmann::json::object();
    }
    auto j = nlohmann::json::parse(body);
    if (!j.is_object()) {
        throw domain::ContainerError(domain::ErrorCode::INVALID_PARAMETER, "Request body must be a JSON object");
    }
    return j;
}

/**
 * @brief Выполнить обработчик, переводя исключения в HTTP ответ
 *
 * ContainerError -> статус по коду, ошибка разбора JSON -> 400,
 * всё остальное -> 500 с записью в лог.
 */
template <typename Fn>
void respondGuarded(IResponse& res, const char* component, Fn&& fn) {
    try {
        fn();
    } catch (const domain::ContainerError& e) {
        sendError(res, e);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[" << component << "] Bad request: " << e.what() << std::endl;
        sendError(res, 400, "Invalid JSON");
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] Error: " << e.what() << std::endl;
        sendError(res, 500, "Internal server error");
    }
}

} // namespace containers::adapters::primary
