#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "utils/StringUtils.hpp"

#include <memory>
#include <iostream>

namespace containers::adapters::primary
{

    /**
     * @brief Разводит запросы под /container по handler'ам
     *
     * /container/templates/... и /container/register/... совпадают по глубине
     * с /container/{serial}/{action}, поэтому выбор делается по второму сегменту,
     * а не по шаблону маршрута сервера.
     */
    class ContainerRouter : public IHttpHandler
    {
    public:
        ContainerRouter(
            std::shared_ptr<IHttpHandler> containers,
            std::shared_ptr<IHttpHandler> templates,
            std::shared_ptr<IHttpHandler> registration,
            std::shared_ptr<IHttpHandler> finalize)
            : containers_(std::move(containers))
            , templates_(std::move(templates))
            , registration_(std::move(registration))
            , finalize_(std::move(finalize))
        {
            std::cout << "[ContainerRouter] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            auto segments = utils::pathSegments(req.getPath());
            std::string second = segments.size() > 1 ? segments[1] : "";

            if (second == "templates")
            {
                templates_->handle(req, res);
            }
            else if (second == "register")
            {
                bool isFinalize = segments.size() == 3 && segments[2] == "finalize";
                (isFinalize ? finalize_ : registration_)->handle(req, res);
            }
            else
            {
                containers_->handle(req, res);
            }
        }

    private:
        std::shared_ptr<IHttpHandler> containers_;
        std::shared_ptr<IHttpHandler> templates_;
        std::shared_ptr<IHttpHandler> registration_;
        std::shared_ptr<IHttpHandler> finalize_;
    };

} // namespace containers::adapters::primary
