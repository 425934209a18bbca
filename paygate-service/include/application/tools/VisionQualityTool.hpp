#pragma once

#include "application/tools/IOracleTool.hpp"
#include "domain/PaymentException.hpp"
#include "utils/IdGenerator.hpp"
#include <string>

namespace paygate::application::tools {

/**
 * @brief verify_asset_quality: оценка качества актива по изображению
 *
 * POST /api/v1/perceive {"image_source": ...} на vision-оракул.
 * Ответ {make, model, year, color, confidence_score, estimated_price}
 * превращается в наблюдение Asset (домен VEHICLE).
 */
class VisionQualityTool : public IOracleTool {
public:
    VisionQualityTool(std::string host, int port) : host_(std::move(host)), port_(port) {}

    std::string name() const override { return "verify_asset_quality"; }
    std::string method() const override { return "POST"; }
    std::string uriTemplate() const override { return "/api/v1/perceive"; }

    std::vector<ToolParameter> parameters() const override {
        return {{"image_source", ParamType::STRING}};
    }

    domain::OracleRequest buildRequest(const nlohmann::json& params) const override {
        const auto imageSource = params.at("image_source").get<std::string>();
        if (imageSource.empty()) {
            throw domain::ValidationException("image_source must not be empty");
        }

        domain::OracleRequest request;
        request.method = method();
        request.host = host_;
        request.port = port_;
        request.path = uriTemplate();
        request.body = nlohmann::json{{"image_source", imageSource}}.dump();
        request.headers["Content-Type"] = "application/json";
        return request;
    }

    nlohmann::json mapResponse(const std::string& body, const nlohmann::json&) const override {
        auto observation = nlohmann::json::parse(body);
        if (!observation.is_object()) {
            throw domain::ProtocolViolationException("vision oracle returned non-object observation");
        }

        nlohmann::json asset;
        asset["identifier"] = utils::IdGenerator::withPrefix("colab-savant-vision");
        asset["domain"] = "ASSET_DOMAIN_VEHICLE";
        asset["status"] = "ASSET_STATUS_AVAILABLE";
        asset["vehicle"] = {
            {"make", observation.value("make", "Unknown")},
            {"model", observation.value("model", "Unknown")},
            {"year", observation.value("year", 0)},
            {"color", observation.value("color", "Unknown")}
        };
        asset["metadata"] = {
            {"confidence_score", asText(observation, "confidence_score")},
            {"estimated_price", asText(observation, "estimated_price")}
        };
        return asset;
    }

    std::string report(const nlohmann::json& params, const nlohmann::json& payload) const override {
        return "[Bee.Savant Report]\nVerified asset quality for " +
               params.value("image_source", "") + ".\nDomain: " +
               payload.value("domain", "") + ". Confidence: " +
               payload["metadata"].value("confidence_score", "") + ".";
    }

private:
    // Числа и строки одинаково сводятся к строке; отсутствие -> "0.0"
    static std::string asText(const nlohmann::json& observation, const char* field) {
        if (!observation.contains(field) || observation[field].is_null()) {
            return "0.0";
        }
        const auto& value = observation[field];
        return value.is_string() ? value.get<std::string>() : value.dump();
    }

    std::string host_;
    int port_;
};

} // namespace paygate::application::tools
