#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/CachedAuthClient.hpp"
#include "adapters/secondary/HttpAuthClient.hpp"
#include "settings/AuthClientSettings.hpp"
#include <IHttpClient.hpp>

#include <cstdlib>
#include <stdexcept>

using namespace containers;
using namespace containers::adapters::secondary;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Mocks
// ============================================================================

class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(bool, send, (const IRequest& req, IResponse& res), (override));
};

class MockHttpAuthClient : public HttpAuthClient {
public:
    MockHttpAuthClient()
        : HttpAuthClient(
            std::make_shared<MockHttpClient>(),
            std::make_shared<settings::AuthClientSettings>()
        ) {}

    MOCK_METHOD(ports::output::TokenValidationResult, validateAccessToken, (const std::string& token), (override));
};

namespace {

ports::output::TokenValidationResult accepted(const std::string& userId) {
    ports::output::TokenValidationResult result;
    result.valid = true;
    result.userId = userId;
    result.message = "OK";
    return result;
}

ports::output::TokenValidationResult denied() {
    ports::output::TokenValidationResult result;
    result.message = "Token expired";
    return result;
}

} // namespace

// ============================================================================
// HttpAuthClient
// ============================================================================

class HttpAuthClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<MockHttpClient>();
        client_ = std::make_shared<HttpAuthClient>(http_, std::make_shared<settings::AuthClientSettings>());
    }

    std::shared_ptr<MockHttpClient> http_;
    std::shared_ptr<HttpAuthClient> client_;
};

TEST_F(HttpAuthClientTest, ValidToken_ReturnsUserId) {
    EXPECT_CALL(*http_, send(_, _))
        .WillOnce(Invoke([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getMethod(), "POST");
            EXPECT_NE(req.getBody().find("\"type\":\"access\""), std::string::npos);
            res.setResult(200, "application/json", R"({"valid":true,"user_id":"admin-1","message":"OK"})");
            return true;
        }));

    auto result = client_->validateAccessToken("tok");

    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.userId, "admin-1");
}

TEST_F(HttpAuthClientTest, NonOkStatus_Rejects) {
    EXPECT_CALL(*http_, send(_, _))
        .WillOnce(Invoke([](const IRequest&, IResponse& res) {
            res.setResult(503, "application/json", "{}");
            return true;
        }));

    auto result = client_->validateAccessToken("tok");

    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.message.find("503"), std::string::npos);
}

TEST_F(HttpAuthClientTest, TransportError_RejectsWithoutThrowing) {
    EXPECT_CALL(*http_, send(_, _))
        .WillOnce(Throw(std::runtime_error("connection refused")));

    EXPECT_FALSE(client_->getUserIdFromToken("tok").has_value());
}

// ============================================================================
// CachedAuthClient
// ============================================================================

class CachedAuthClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        delegate_ = std::make_shared<MockHttpAuthClient>();
        settings_ = std::make_shared<settings::AuthClientSettings>();
        cached_ = std::make_shared<CachedAuthClient>(delegate_, settings_);
    }

    std::shared_ptr<MockHttpAuthClient> delegate_;
    std::shared_ptr<settings::AuthClientSettings> settings_;
    std::shared_ptr<CachedAuthClient> cached_;
};

TEST_F(CachedAuthClientTest, SecondCall_UsesCache) {
    EXPECT_CALL(*delegate_, validateAccessToken("tok"))
        .Times(1)
        .WillOnce(Return(accepted("admin-1")));

    cached_->validateAccessToken("tok");
    auto userId = cached_->getUserIdFromToken("tok");

    ASSERT_TRUE(userId.has_value());
    EXPECT_EQ(*userId, "admin-1");
    EXPECT_EQ(cached_->getCacheSize(), 1u);
}

TEST_F(CachedAuthClientTest, RejectedToken_IsNotCached) {
    EXPECT_CALL(*delegate_, validateAccessToken("tok"))
        .Times(2)
        .WillOnce(Return(denied()))
        .WillOnce(Return(accepted("admin-1")));

    EXPECT_FALSE(cached_->validateAccessToken("tok").valid);
    EXPECT_TRUE(cached_->validateAccessToken("tok").valid);
}

TEST_F(CachedAuthClientTest, ClearCache_ForcesRevalidation) {
    EXPECT_CALL(*delegate_, validateAccessToken("tok"))
        .Times(2)
        .WillRepeatedly(Return(accepted("admin-1")));

    cached_->validateAccessToken("tok");
    cached_->clearCache();
    cached_->validateAccessToken("tok");
}

TEST(CachedAuthClientDisabledTest, ZeroTtl_AlwaysDelegates) {
    setenv("AUTH_CACHE_TTL_SECONDS", "0", 1);
    auto settings = std::make_shared<settings::AuthClientSettings>();
    unsetenv("AUTH_CACHE_TTL_SECONDS");

    auto delegate = std::make_shared<MockHttpAuthClient>();
    CachedAuthClient cached(delegate, settings);

    EXPECT_CALL(*delegate, validateAccessToken("tok"))
        .Times(2)
        .WillRepeatedly(Return(accepted("admin-1")));

    cached.validateAccessToken("tok");
    cached.validateAccessToken("tok");
    EXPECT_EQ(cached.getCacheSize(), 0u);
}
