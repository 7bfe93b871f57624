#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"
#include "utils/StringUtils.hpp"

#include <memory>
#include <iostream>

namespace containers::adapters::primary
{

    /**
     * @brief Декоратор для подсчёта HTTP метрик
     *
     * Инкрементирует http_requests_total{method,path} и делегирует обработку.
     * Path нормализуется, чтобы serial'ы и имена шаблонов не плодили ключи:
     * - /container/CONT0001ABCD/add -> /container/{serial}
     * - /container/templates/phone/compare -> /container/templates
     * - /container/register/finalize -> /container/register
     * - /token/TOTP0001ABCD -> /token
     */
    class MetricsDecoratorHandler : public IHttpHandler
    {
    public:
        MetricsDecoratorHandler(
            std::shared_ptr<IHttpHandler> inner,
            std::shared_ptr<ports::input::IMetricsService> metrics) : inner_(std::move(inner)), metrics_(std::move(metrics))
        {
        }

        void handle(IRequest &req, IResponse &res) override
        {
            metrics_->increment("http_requests_total", {{"method", req.getMethod()},
                                                        {"path", normalizePath(req.getPath())}});

            inner_->handle(req, res);
        }

        static std::string normalizePath(const std::string &path)
        {
            auto segments = utils::pathSegments(path);
            if (segments.empty())
            {
                return "/";
            }

            if (segments[0] == "container" && segments.size() > 1)
            {
                const std::string &second = segments[1];
                if (second == "templates" || second == "register")
                {
                    return "/container/" + second;
                }
                if (second == "init" && segments.size() == 2)
                {
                    return "/container/init";
                }
                return "/container/{serial}";
            }

            // /token/init, /token/enable, /token/{serial} -> /token
            return "/" + segments[0];
        }

    private:
        std::shared_ptr<IHttpHandler> inner_;
        std::shared_ptr<ports::input::IMetricsService> metrics_;
    };

} // namespace containers::adapters::primary
