/**
 * @file ContainerRouterTest.cpp
 * @brief Тесты разводки /container/** и декоратора HTTP метрик
 */

#include <gtest/gtest.h>

#include "adapters/primary/ContainerRouter.hpp"
#include "adapters/primary/MetricsDecoratorHandler.hpp"
#include "application/MetricsService.hpp"
#include "settings/MetricsSettings.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>

using namespace containers;
using namespace containers::adapters::primary;

namespace
{

    /**
     * @brief Handler-заглушка: запоминает число вызовов и отвечает своим статусом
     */
    class RecordingHandler : public IHttpHandler
    {
    public:
        explicit RecordingHandler(int status) : status_(status) {}

        int calls = 0;

        void handle(IRequest &, IResponse &res) override
        {
            ++calls;
            res.setResult(status_, "application/json", "{}");
        }

    private:
        int status_;
    };

} // namespace

class ContainerRouterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        containers_ = std::make_shared<RecordingHandler>(200);
        templates_ = std::make_shared<RecordingHandler>(201);
        registration_ = std::make_shared<RecordingHandler>(202);
        finalize_ = std::make_shared<RecordingHandler>(203);
        router_ = std::make_shared<ContainerRouter>(containers_, templates_, registration_, finalize_);
    }

    int route(const std::string &method, const std::string &path)
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        SimpleResponse res;
        router_->handle(req, res);
        return res.getStatus();
    }

    std::shared_ptr<RecordingHandler> containers_;
    std::shared_ptr<RecordingHandler> templates_;
    std::shared_ptr<RecordingHandler> registration_;
    std::shared_ptr<RecordingHandler> finalize_;
    std::shared_ptr<ContainerRouter> router_;
};

TEST_F(ContainerRouterTest, DispatchesBySecondSegment)
{
    EXPECT_EQ(route("GET", "/container"), 200);
    EXPECT_EQ(route("POST", "/container/SMPH0001ABCD/add"), 200);
    EXPECT_EQ(route("DELETE", "/container/SMPH0001ABCD/info/location"), 200);
    EXPECT_EQ(route("GET", "/container/templates"), 201);
    EXPECT_EQ(route("GET", "/container/templates/T1/compare"), 201);
    EXPECT_EQ(route("POST", "/container/register/initialize"), 202);
    EXPECT_EQ(route("POST", "/container/register/SMPH0001ABCD/terminate"), 202);
    EXPECT_EQ(route("POST", "/container/register/finalize"), 203);

    EXPECT_EQ(containers_->calls, 3);
    EXPECT_EQ(templates_->calls, 2);
    EXPECT_EQ(registration_->calls, 2);
    EXPECT_EQ(finalize_->calls, 1);
}

TEST(MetricsDecoratorHandlerTest, NormalizePath_CollapsesIdentifiers)
{
    EXPECT_EQ(MetricsDecoratorHandler::normalizePath("/container"), "/container");
    EXPECT_EQ(MetricsDecoratorHandler::normalizePath("/container/init"), "/container/init");
    EXPECT_EQ(MetricsDecoratorHandler::normalizePath("/container/SMPH0001ABCD"), "/container/{serial}");
    EXPECT_EQ(MetricsDecoratorHandler::normalizePath("/container/SMPH0001ABCD/info/x"), "/container/{serial}");
    EXPECT_EQ(MetricsDecoratorHandler::normalizePath("/container/templates/T1/compare"), "/container/templates");
    EXPECT_EQ(MetricsDecoratorHandler::normalizePath("/container/register/finalize"), "/container/register");
    EXPECT_EQ(MetricsDecoratorHandler::normalizePath("/token/TOTP0001ABCD"), "/token");
    EXPECT_EQ(MetricsDecoratorHandler::normalizePath("/"), "/");
}

TEST(MetricsDecoratorHandlerTest, CountsRequestAndDelegates)
{
    auto metrics = std::make_shared<application::MetricsService>(std::make_shared<settings::MetricsSettings>());
    auto inner = std::make_shared<RecordingHandler>(200);
    MetricsDecoratorHandler decorator(inner, metrics);

    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/container/SMPH0001ABCD");
    SimpleResponse res;
    decorator.handle(req, res);
    decorator.handle(req, res);

    EXPECT_EQ(inner->calls, 2);
    EXPECT_EQ(metrics->get("http_requests_total", {{"method", "GET"}, {"path", "/container/{serial}"}}), 2);
    EXPECT_NE(metrics->toPrometheusFormat().find("http_requests_total"), std::string::npos);
}
