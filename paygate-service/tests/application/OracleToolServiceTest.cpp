/**
 * @file OracleToolServiceTest.cpp
 * @brief Unit tests for OracleToolService and the oracle tools
 */

#include <gtest/gtest.h>
#include "application/OracleToolService.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include "../mocks/MockPaymentOrchestrator.hpp"
#include "../mocks/TestSettings.hpp"
#include <nlohmann/json.hpp>

using namespace paygate;
using namespace paygate::application;
using namespace paygate::tests;
using json = nlohmann::json;

class OracleToolServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        orchestrator_ = std::make_shared<MockPaymentOrchestrator>();
        publisher_ = std::make_shared<MockEventPublisher>();
        service_ = std::make_shared<OracleToolService>(
            orchestrator_,
            std::make_shared<TestOracleSettings>(),
            std::make_shared<TestPaymentSettings>(),
            publisher_);
    }

    std::shared_ptr<MockPaymentOrchestrator> orchestrator_;
    std::shared_ptr<MockEventPublisher> publisher_;
    std::shared_ptr<OracleToolService> service_;
};

// ============================================================================
// ТЕСТЫ: реестр и валидация
// ============================================================================

TEST_F(OracleToolServiceTest, ListTools_ReturnsAllRegistered) {
    auto tools = service_->listTools();

    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0], "appraise_honey_code");
    EXPECT_EQ(tools[1], "forage_balances");
    EXPECT_EQ(tools[2], "verify_asset_quality");
}

TEST_F(OracleToolServiceTest, UnknownTool_IsValidationError) {
    auto result = service_->call("summon_bees", json::object());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCategory, domain::ErrorCategory::VALIDATION);
    EXPECT_EQ(orchestrator_->executeCallCount(), 0);
}

TEST_F(OracleToolServiceTest, MissingParameter_IsValidationErrorWithoutNetwork) {
    auto result = service_->call("verify_asset_quality", json::object());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCategory, domain::ErrorCategory::VALIDATION);
    EXPECT_NE(result.message.find("image_source"), std::string::npos);
    EXPECT_FALSE(result.retrySafe());
    EXPECT_EQ(orchestrator_->executeCallCount(), 0);
}

TEST_F(OracleToolServiceTest, WrongParameterType_IsValidationError) {
    auto result = service_->call("verify_asset_quality", json{{"image_source", 42}});

    EXPECT_EQ(result.errorCategory, domain::ErrorCategory::VALIDATION);
    EXPECT_EQ(orchestrator_->executeCallCount(), 0);
}

TEST_F(OracleToolServiceTest, NonObjectParameters_IsValidationError) {
    auto result = service_->call("verify_asset_quality", json::array({"ipfs://x"}));

    EXPECT_EQ(result.errorCategory, domain::ErrorCategory::VALIDATION);
}

TEST_F(OracleToolServiceTest, UndeclaredParameters_DoNotChangeFingerprint) {
    orchestrator_->respondWith(200, R"({"make":"Toyota"})");

    service_->call("verify_asset_quality", json{{"image_source", "ipfs://car"}});
    service_->call("verify_asset_quality", json{{"image_source", "ipfs://car"}, {"trace", "xyz"}});

    ASSERT_EQ(orchestrator_->executeCallCount(), 2);
    const auto& requests = orchestrator_->requests();
    EXPECT_EQ(requests[0].canonicalParams, requests[1].canonicalParams);
    EXPECT_EQ(domain::RequestFingerprint::of(requests[0]), domain::RequestFingerprint::of(requests[1]));
}

// ============================================================================
// ТЕСТЫ: verify_asset_quality
// ============================================================================

TEST_F(OracleToolServiceTest, VisionQuality_BuildsPerceiveRequest) {
    orchestrator_->respondWith(200, R"({"make":"Toyota"})");

    service_->call("verify_asset_quality", json{{"image_source", "ipfs://car"}});

    ASSERT_EQ(orchestrator_->executeCallCount(), 1);
    const auto& req = orchestrator_->requests()[0];
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.host, "vision-oracle");
    EXPECT_EQ(req.port, 8081);
    EXPECT_EQ(req.path, "/api/v1/perceive");
    EXPECT_EQ(json::parse(req.body)["image_source"], "ipfs://car");
}

TEST_F(OracleToolServiceTest, VisionQuality_MapsObservationToAsset) {
    orchestrator_->respondWith(200, R"({
        "make":"Toyota","model":"Corolla","year":2019,"color":"Red",
        "confidence_score":0.93,"estimated_price":"15000"
    })");

    auto result = service_->call("verify_asset_quality", json{{"image_source", "ipfs://car"}});

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.paid);
    EXPECT_EQ(result.payload["domain"], "ASSET_DOMAIN_VEHICLE");
    EXPECT_EQ(result.payload["vehicle"]["make"], "Toyota");
    EXPECT_EQ(result.payload["vehicle"]["year"], 2019);
    EXPECT_EQ(result.payload["metadata"]["confidence_score"], "0.93");
    EXPECT_EQ(result.payload["metadata"]["estimated_price"], "15000");
    EXPECT_EQ(result.payload["identifier"].get<std::string>().rfind("colab-savant-vision-", 0), 0u);
}

TEST_F(OracleToolServiceTest, VisionQuality_MissingFieldsUseDefaults) {
    orchestrator_->respondWith(200, "{}");

    auto result = service_->call("verify_asset_quality", json{{"image_source", "ipfs://car"}});

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.payload["vehicle"]["make"], "Unknown");
    EXPECT_EQ(result.payload["vehicle"]["year"], 0);
    EXPECT_EQ(result.payload["metadata"]["confidence_score"], "0.0");
}

TEST_F(OracleToolServiceTest, VisionQuality_EmptySourceIsValidationError) {
    auto result = service_->call("verify_asset_quality", json{{"image_source", ""}});

    EXPECT_EQ(result.errorCategory, domain::ErrorCategory::VALIDATION);
    EXPECT_EQ(orchestrator_->executeCallCount(), 0);
}

// ============================================================================
// ТЕСТЫ: appraise_honey_code
// ============================================================================

TEST_F(OracleToolServiceTest, RepoAppraisal_ComputesLowAffinityValue) {
    orchestrator_->respondWith(200, R"({"size":450,"stargazers_count":12})");

    auto result = service_->call("appraise_honey_code",
                                 json{{"repo_url", "https://github.com/octo/hive"}});

    ASSERT_TRUE(result.success);
    EXPECT_EQ(orchestrator_->requests()[0].path, "/repos/octo/hive");
    EXPECT_EQ(orchestrator_->requests()[0].method, "GET");
    EXPECT_NEAR(result.payload["affinity"].get<double>(), 0.3399, 1e-9);
    EXPECT_EQ(result.payload["recommended_protocol_value"], "50.49 SURGE");
    EXPECT_EQ(result.payload["status"], "Low Affinity");
    EXPECT_EQ(result.payload["integrity"], "Verified");
}

TEST_F(OracleToolServiceTest, RepoAppraisal_TrenchchatIsHighQuality) {
    orchestrator_->respondWith(200, R"({"size":450,"stargazers_count":12})");

    auto result = service_->call("appraise_honey_code",
                                 json{{"repo_url", "https://github.com/TrenchChat/core"}});

    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.payload["affinity"].get<double>(), 0.5871, 1e-9);
    EXPECT_EQ(result.payload["recommended_protocol_value"], "75.21 SURGE");
    EXPECT_EQ(result.payload["status"], "High-Quality Code-Honey Detected");
}

TEST_F(OracleToolServiceTest, RepoAppraisal_InvalidUrlIsValidationError) {
    auto result = service_->call("appraise_honey_code", json{{"repo_url", "https://github.com/"}});

    EXPECT_EQ(result.errorCategory, domain::ErrorCategory::VALIDATION);
    EXPECT_EQ(orchestrator_->executeCallCount(), 0);
}

TEST(RepoAppraisalToolTest, ComplexityIsClamped) {
    EXPECT_DOUBLE_EQ(tools::RepoAppraisalTool::computeComplexity(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(tools::RepoAppraisalTool::computeComplexity(500000, 900), 10.0);
    EXPECT_DOUBLE_EQ(tools::RepoAppraisalTool::computeComplexity(2000, 10), 3.0);
}

TEST(RepoAppraisalToolTest, PathSegments_IgnoreSchemeHostAndQuery) {
    auto segments = tools::RepoAppraisalTool::pathSegments("https://github.com/owner/repo/tree/main?tab=readme");

    ASSERT_EQ(segments.size(), 4u);
    EXPECT_EQ(segments[0], "owner");
    EXPECT_EQ(segments[1], "repo");

    auto bare = tools::RepoAppraisalTool::pathSegments("owner/repo");
    ASSERT_EQ(bare.size(), 2u);
}

// ============================================================================
// ТЕСТЫ: forage_balances
// ============================================================================

TEST_F(OracleToolServiceTest, BalanceForaging_MapsTokenItems) {
    orchestrator_->respondWith(200, R"({"data":{"items":[
        {"contract_ticker_symbol":"SOL","balance":"1500000000"},
        {"balance":42}
    ]}})");

    auto result = service_->call("forage_balances",
                                 json{{"chain", "solana-mainnet"}, {"address", "9xQeWvG816bUx9EP"}});

    ASSERT_TRUE(result.success);
    EXPECT_EQ(orchestrator_->requests()[0].path, "/v1/solana-mainnet/address/9xQeWvG816bUx9EP/balances/");
    EXPECT_EQ(orchestrator_->requests()[0].host, "chain-oracle");
    EXPECT_EQ(result.payload["token_count"], 2);
    EXPECT_EQ(result.payload["tokens"][0]["symbol"], "SOL");
    EXPECT_EQ(result.payload["tokens"][0]["balance"], "1500000000");
    EXPECT_EQ(result.payload["tokens"][1]["symbol"], "UNKNOWN");
    EXPECT_EQ(result.payload["tokens"][1]["balance"], "42");
}

TEST_F(OracleToolServiceTest, BalanceForaging_RejectsPathCharacters) {
    auto result = service_->call("forage_balances",
                                 json{{"chain", "solana"}, {"address", "../admin"}});

    EXPECT_EQ(result.errorCategory, domain::ErrorCategory::VALIDATION);
    EXPECT_EQ(orchestrator_->executeCallCount(), 0);
}

TEST_F(OracleToolServiceTest, BalanceForaging_MissingDataIsProtocolViolation) {
    orchestrator_->respondWith(200, R"({"error":false})");

    auto result = service_->call("forage_balances",
                                 json{{"chain", "solana"}, {"address", "abc"}});

    EXPECT_EQ(result.errorCategory, domain::ErrorCategory::PROTOCOL_VIOLATION);
}

// ============================================================================
// ТЕСТЫ: ошибки и события
// ============================================================================

TEST_F(OracleToolServiceTest, MalformedOracleBody_IsProtocolViolation) {
    orchestrator_->respondWith(200, "not json at all");

    auto result = service_->call("verify_asset_quality", json{{"image_source", "ipfs://car"}});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCategory, domain::ErrorCategory::PROTOCOL_VIOLATION);
    EXPECT_EQ(publisher_->countByRoutingKey("oracle.report"), 0);
}

TEST_F(OracleToolServiceTest, PaymentErrors_MapToCategories) {
    orchestrator_->setScript([](const domain::OracleRequest&) -> domain::CallOutcome {
        throw domain::AuthorizationException(domain::AuthorizationFailure::SPEND_LIMIT_EXCEEDED, "too much");
    });
    auto refused = service_->call("verify_asset_quality", json{{"image_source", "ipfs://car"}});
    EXPECT_EQ(refused.errorCategory, domain::ErrorCategory::AUTHORIZATION);
    EXPECT_FALSE(refused.retrySafe());

    orchestrator_->setScript([](const domain::OracleRequest&) -> domain::CallOutcome {
        throw domain::SettlementAmbiguousException("still pending");
    });
    auto ambiguous = service_->call("verify_asset_quality", json{{"image_source", "ipfs://car"}});
    EXPECT_EQ(ambiguous.errorCategory, domain::ErrorCategory::SETTLEMENT_AMBIGUOUS);
    EXPECT_TRUE(ambiguous.retrySafe());

    auto body = ambiguous.toJson();
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_EQ(body["error"], "SETTLEMENT_AMBIGUOUS");
    EXPECT_TRUE(body["retry_safe"].get<bool>());
    EXPECT_FALSE(body.contains("payload"));
}

TEST_F(OracleToolServiceTest, Success_PublishesOracleReport) {
    orchestrator_->respondWith(200, R"({"size":450,"stargazers_count":12})");

    service_->call("appraise_honey_code", json{{"repo_url", "https://github.com/octo/hive"}});

    ASSERT_EQ(publisher_->countByRoutingKey("oracle.report"), 1);
    auto event = json::parse(publisher_->getPublishedMessages()[0].message);
    EXPECT_EQ(event["tool"], "appraise_honey_code");
    auto report = event["report"].get<std::string>();
    EXPECT_NE(report.find("[Bee.Savant Report]"), std::string::npos);
    EXPECT_NE(report.find("50.49 SURGE"), std::string::npos);
}

TEST_F(OracleToolServiceTest, ReportFailure_DoesNotFailCall) {
    publisher_->setShouldFail(true);
    orchestrator_->respondWith(200, R"({"make":"Toyota"})");

    auto result = service_->call("verify_asset_quality", json{{"image_source", "ipfs://car"}});

    EXPECT_TRUE(result.success);
}
