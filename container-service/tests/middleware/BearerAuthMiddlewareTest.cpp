/**
 * @file BearerAuthMiddlewareTest.cpp
 * @brief Unit-тесты для BearerAuthMiddleware и ChainHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/BearerAuthMiddleware.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "ports/output/IAuthClient.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace containers;
using namespace containers::adapters::primary;
using ::testing::_;
using ::testing::Return;

namespace
{

    // ============================================================================
    // Mocks
    // ============================================================================

    class MockAuthClient : public ports::output::IAuthClient
    {
    public:
        MOCK_METHOD(ports::output::TokenValidationResult, validateAccessToken, (const std::string &), (override));
        MOCK_METHOD(std::optional<std::string>, getUserIdFromToken, (const std::string &), (override));
    };

    /**
     * @brief Конечный handler цепочки: отвечает userId из attributes
     */
    class EchoUserHandler : public IHttpHandler
    {
    public:
        int calls = 0;

        void handle(IRequest &req, IResponse &res) override
        {
            ++calls;
            nlohmann::json body;
            body["userId"] = req.getAttribute("userId").value_or("");
            res.setResult(200, "application/json", body.dump());
        }
    };

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class BearerAuthMiddlewareTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockAuthClient_ = std::make_shared<MockAuthClient>();
        middleware_ = std::make_shared<BearerAuthMiddleware>(mockAuthClient_);
    }

    SimpleRequest createRequest(const std::string &token = "")
    {
        SimpleRequest req;
        req.setMethod("GET");
        req.setPath("/container");
        if (!token.empty())
        {
            req.setHeader("Authorization", "Bearer " + token);
        }
        return req;
    }

    std::shared_ptr<MockAuthClient> mockAuthClient_;
    std::shared_ptr<BearerAuthMiddleware> middleware_;
};

// ============================================================================
// ТЕСТЫ
// ============================================================================

TEST_F(BearerAuthMiddlewareTest, ValidToken_SetsUserIdAttribute)
{
    EXPECT_CALL(*mockAuthClient_, getUserIdFromToken("admin-token"))
        .WillOnce(Return(std::optional<std::string>("admin")));

    auto req = createRequest("admin-token");
    SimpleResponse res;

    middleware_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 0);
    EXPECT_EQ(req.getAttribute("userId").value_or(""), "admin");
}

TEST_F(BearerAuthMiddlewareTest, NoToken_Returns401WithoutCallingAuth)
{
    EXPECT_CALL(*mockAuthClient_, getUserIdFromToken(_)).Times(0);

    auto req = createRequest();
    SimpleResponse res;

    middleware_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["error"], "Authorization required");
}

TEST_F(BearerAuthMiddlewareTest, InvalidToken_Returns401)
{
    EXPECT_CALL(*mockAuthClient_, getUserIdFromToken("bad"))
        .WillOnce(Return(std::nullopt));

    auto req = createRequest("bad");
    SimpleResponse res;

    middleware_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["error"], "Token not valid");
}

TEST_F(BearerAuthMiddlewareTest, Chain_ValidToken_ReachesHandler)
{
    EXPECT_CALL(*mockAuthClient_, getUserIdFromToken("admin-token"))
        .WillOnce(Return(std::optional<std::string>("admin")));

    auto echo = std::make_shared<EchoUserHandler>();
    serverlib::ChainHandler chain(middleware_, echo);

    auto req = createRequest("admin-token");
    SimpleResponse res;
    chain.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(echo->calls, 1);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["userId"], "admin");
}

TEST_F(BearerAuthMiddlewareTest, Chain_InvalidToken_StopsBeforeHandler)
{
    EXPECT_CALL(*mockAuthClient_, getUserIdFromToken(_))
        .WillOnce(Return(std::nullopt));

    auto echo = std::make_shared<EchoUserHandler>();
    serverlib::ChainHandler chain(middleware_, echo);

    auto req = createRequest("expired");
    SimpleResponse res;
    chain.handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_EQ(echo->calls, 0);
}

TEST_F(BearerAuthMiddlewareTest, Chain_OnlyMiddleware_Returns500)
{
    EXPECT_CALL(*mockAuthClient_, getUserIdFromToken(_))
        .WillOnce(Return(std::optional<std::string>("admin")));

    serverlib::ChainHandler chain(middleware_);

    auto req = createRequest("admin-token");
    SimpleResponse res;
    chain.handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}
