#pragma once

#include "application/tools/IOracleTool.hpp"
#include "domain/PaymentException.hpp"
#include <cctype>
#include <string>

namespace paygate::application::tools {

/**
 * @brief forage_balances: балансы токенов адреса через on-chain оракул
 *
 * GET /v1/{chain}/address/{address}/balances/ ; из data.items берутся
 * тикер и баланс каждого токена.
 */
class BalanceForagingTool : public IOracleTool {
public:
    BalanceForagingTool(std::string host, int port) : host_(std::move(host)), port_(port) {}

    std::string name() const override { return "forage_balances"; }
    std::string method() const override { return "GET"; }
    std::string uriTemplate() const override { return "/v1/{chain}/address/{address}/balances/"; }

    std::vector<ToolParameter> parameters() const override {
        return {{"chain", ParamType::STRING}, {"address", ParamType::STRING}};
    }

    domain::OracleRequest buildRequest(const nlohmann::json& params) const override {
        const auto chain = params.at("chain").get<std::string>();
        const auto address = params.at("address").get<std::string>();
        requirePathSafe("chain", chain);
        requirePathSafe("address", address);

        domain::OracleRequest request;
        request.method = method();
        request.host = host_;
        request.port = port_;
        request.path = "/v1/" + chain + "/address/" + address + "/balances/";
        request.headers["Accept"] = "application/json";
        return request;
    }

    nlohmann::json mapResponse(const std::string& body, const nlohmann::json& params) const override {
        auto root = nlohmann::json::parse(body);
        if (!root.is_object() || !root.contains("data") || !root["data"].is_object()) {
            throw domain::ProtocolViolationException("chain oracle response has no data object");
        }

        const auto& items = root["data"].contains("items") ? root["data"]["items"] : nlohmann::json::array();
        if (!items.is_array()) {
            throw domain::ProtocolViolationException("chain oracle data.items is not an array");
        }

        nlohmann::json tokens = nlohmann::json::array();
        for (const auto& item : items) {
            const auto& balance = item.contains("balance") ? item["balance"] : nlohmann::json("0");
            tokens.push_back({
                {"symbol", item.value("contract_ticker_symbol", "UNKNOWN")},
                {"balance", balance.is_string() ? balance.get<std::string>() : balance.dump()}
            });
        }

        nlohmann::json result;
        result["address"] = params.at("address").get<std::string>();
        result["chain"] = params.at("chain").get<std::string>();
        result["token_count"] = tokens.size();
        result["tokens"] = tokens;
        return result;
    }

    std::string report(const nlohmann::json&, const nlohmann::json& payload) const override {
        return "[Bee.Savant Report]\nForaged " + std::to_string(payload.value("token_count", 0)) +
               " token balances for " + payload.value("address", "") + " on " +
               payload.value("chain", "") + ".";
    }

private:
    static void requirePathSafe(const std::string& field, const std::string& value) {
        if (value.empty()) {
            throw domain::ValidationException(field + " must not be empty");
        }
        if (value == "." || value == "..") {
            throw domain::ValidationException(field + " is not a path segment");
        }
        for (char c : value) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
                throw domain::ValidationException(field + " contains invalid character");
            }
        }
    }

    std::string host_;
    int port_;
};

} // namespace paygate::application::tools
