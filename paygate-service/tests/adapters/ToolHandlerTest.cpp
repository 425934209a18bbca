#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/ToolHandler.hpp"
#include "ports/input/IOracleToolService.hpp"
#include "../mocks/TestSettings.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace paygate;
using namespace paygate::adapters::primary;
using ::testing::_;
using ::testing::Return;

// ============================================================================
// Mock для IOracleToolService
// ============================================================================

class MockOracleToolService : public ports::input::IOracleToolService {
public:
    MOCK_METHOD(domain::ToolCallResult, call, (const std::string& toolName, const nlohmann::json& params), (override));
    MOCK_METHOD(std::vector<std::string>, listTools, (), (const, override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class ToolHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockService_ = std::make_shared<MockOracleToolService>();
        handler_ = std::make_unique<ToolHandler>(mockService_);
    }

    SimpleRequest createRequest(const std::string& method,
                                const std::string& path,
                                const std::string& body = "") {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        req.setBody(body);
        return req;
    }

    nlohmann::json parseJson(const std::string& body) {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<MockOracleToolService> mockService_;
    std::unique_ptr<ToolHandler> handler_;
};

// ============================================================================
// ТЕСТЫ: GET /api/v1/tools
// ============================================================================

TEST_F(ToolHandlerTest, ListTools_Returns200) {
    EXPECT_CALL(*mockService_, listTools())
        .WillOnce(Return(std::vector<std::string>{"appraise_honey_code", "forage_balances", "verify_asset_quality"}));

    auto req = createRequest("GET", "/api/v1/tools");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    ASSERT_EQ(json["tools"].size(), 3u);
    EXPECT_EQ(json["tools"][0].get<std::string>(), "appraise_honey_code");
}

// ============================================================================
// ТЕСТЫ: POST /api/v1/tools/{name}
// ============================================================================

TEST_F(ToolHandlerTest, Call_Success_Returns200) {
    EXPECT_CALL(*mockService_, call("verify_asset_quality", _))
        .WillOnce([](const std::string& tool, const nlohmann::json& params) {
            EXPECT_EQ(params["image_source"].get<std::string>(), "ipfs://cid");
            return domain::ToolCallResult::ok(tool, {{"score", 0.9}}, "fp-abc", true);
        });

    auto req = createRequest("POST", "/api/v1/tools/verify_asset_quality", R"({"image_source":"ipfs://cid"})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_TRUE(json["success"].get<bool>());
    EXPECT_TRUE(json["paid"].get<bool>());
    EXPECT_EQ(json["fingerprint"].get<std::string>(), "fp-abc");
    EXPECT_DOUBLE_EQ(json["payload"]["score"].get<double>(), 0.9);
}

TEST_F(ToolHandlerTest, Call_EmptyBody_PassesEmptyObject) {
    EXPECT_CALL(*mockService_, call("appraise_honey_code", _))
        .WillOnce([](const std::string& tool, const nlohmann::json& params) {
            EXPECT_TRUE(params.is_object());
            EXPECT_TRUE(params.empty());
            return domain::ToolCallResult::failed(tool, domain::ErrorCategory::VALIDATION, "repo_url is required");
        });

    auto req = createRequest("POST", "/api/v1/tools/appraise_honey_code");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    auto json = parseJson(res.getBody());
    EXPECT_FALSE(json["success"].get<bool>());
    EXPECT_EQ(json["error"].get<std::string>(), "VALIDATION_ERROR");
    EXPECT_FALSE(json["retry_safe"].get<bool>());
}

TEST_F(ToolHandlerTest, Call_InvalidJson_Returns400) {
    EXPECT_CALL(*mockService_, call(_, _)).Times(0);

    auto req = createRequest("POST", "/api/v1/tools/appraise_honey_code", "{not json");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"].get<std::string>(), "Invalid JSON");
}

TEST_F(ToolHandlerTest, Call_AmbiguousSettlement_Returns504) {
    EXPECT_CALL(*mockService_, call("forage_balances", _))
        .WillOnce(Return(domain::ToolCallResult::failed(
            "forage_balances", domain::ErrorCategory::SETTLEMENT_AMBIGUOUS, "settlement unresolved")));

    auto req = createRequest("POST", "/api/v1/tools/forage_balances?trace=1", R"({"address":"abc"})");
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 504);
    EXPECT_TRUE(parseJson(res.getBody())["retry_safe"].get<bool>());
}

TEST_F(ToolHandlerTest, UnknownRoute_Returns404) {
    EXPECT_CALL(*mockService_, call(_, _)).Times(0);

    SimpleResponse res1;
    auto req1 = createRequest("DELETE", "/api/v1/tools/appraise_honey_code");
    handler_->handle(req1, res1);
    EXPECT_EQ(res1.getStatus(), 404);

    SimpleResponse res2;
    auto req2 = createRequest("POST", "/api/v1/tools/");
    handler_->handle(req2, res2);
    EXPECT_EQ(res2.getStatus(), 404);

    SimpleResponse res3;
    auto req3 = createRequest("POST", "/api/v1/tools/a/b");
    handler_->handle(req3, res3);
    EXPECT_EQ(res3.getStatus(), 404);
}

TEST(ToolHandlerStatusTest, CategoryMapping) {
    using domain::ErrorCategory;
    EXPECT_EQ(ToolHandler::statusFor(ErrorCategory::NONE), 200);
    EXPECT_EQ(ToolHandler::statusFor(ErrorCategory::VALIDATION), 400);
    EXPECT_EQ(ToolHandler::statusFor(ErrorCategory::AUTHORIZATION), 402);
    EXPECT_EQ(ToolHandler::statusFor(ErrorCategory::PROTOCOL_VIOLATION), 502);
    EXPECT_EQ(ToolHandler::statusFor(ErrorCategory::TRANSIENT_NETWORK), 503);
    EXPECT_EQ(ToolHandler::statusFor(ErrorCategory::SETTLEMENT_AMBIGUOUS), 504);
}

// ============================================================================
// ТЕСТЫ: GET /health
// ============================================================================

TEST(HealthHandlerTest, ReportsNetworkAndTools) {
    auto service = std::make_shared<MockOracleToolService>();
    EXPECT_CALL(*service, listTools()).WillOnce(Return(std::vector<std::string>{"appraise_honey_code"}));

    HealthHandler handler(service, std::make_shared<tests::TestPaymentSettings>());

    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/health");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["status"].get<std::string>(), "ok");
    EXPECT_EQ(json["network"].get<std::string>(), "solana-devnet");
    EXPECT_EQ(json["tools"][0].get<std::string>(), "appraise_honey_code");
}
