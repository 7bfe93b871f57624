#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/IAuthClient.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include <memory>
#include <iostream>

namespace containers::adapters::primary
{

    /**
     * @brief Middleware проверки bearer токена администратора
     *
     * При успехе кладёт userId в attributes и сбрасывает статус в 0,
     * иначе отвечает 401 и обрывает цепочку.
     */
    class BearerAuthMiddleware : public IHttpHandler
    {
    public:
        explicit BearerAuthMiddleware(std::shared_ptr<ports::output::IAuthClient> authClient)
            : authClient_(std::move(authClient))
        {
            std::cout << "[BearerAuthMiddleware] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            std::string token = req.getBearerToken().value_or("");
            if (token.empty())
            {
                sendError(res, 401, "Authorization required");
                return;
            }

            auto userId = authClient_->getUserIdFromToken(token).value_or("");
            if (userId.empty())
            {
                sendError(res, 401, "Token not valid");
                return;
            }

            req.setAttribute("userId", userId);
            res.setStatus(0); // для middleware
        }

    private:
        std::shared_ptr<ports::output::IAuthClient> authClient_;
    };

} // namespace containers::adapters::primary
