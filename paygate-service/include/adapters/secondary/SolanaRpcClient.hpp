#pragma once

#include "domain/PaymentException.hpp"
#include "ports/output/ISettlementRpcClient.hpp"
#include "settings/ISettlementRpcSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <iostream>
#include <memory>

namespace paygate::adapters::secondary {

/**
 * @brief Solana JSON-RPC: getSignatureStatuses
 *
 * value[0] == null           -> NOT_FOUND
 * value[0].err != null       -> FAILED
 * confirmed / finalized      -> CONFIRMED
 * processed                  -> PENDING
 */
class SolanaRpcClient : public ports::output::ISettlementRpcClient {
public:
    SolanaRpcClient(std::shared_ptr<IHttpClient> httpClient,
                    std::shared_ptr<settings::ISettlementRpcSettings> settings)
        : httpClient_(std::move(httpClient))
        , settings_(std::move(settings))
    {
        std::cout << "[SolanaRpcClient] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << settings_->getPath() << std::endl;
    }

    domain::SettlementStatus getSignatureStatus(const std::string& transactionId) override {
        nlohmann::json rpc;
        rpc["jsonrpc"] = "2.0";
        rpc["id"] = ++requestId_;
        rpc["method"] = "getSignatureStatuses";
        rpc["params"] = nlohmann::json::array({
            nlohmann::json::array({transactionId}),
            {{"searchTransactionHistory", true}}
        });

        SimpleRequest request(
            "POST",
            settings_->getPath(),
            rpc.dump(),
            settings_->getHost(),
            settings_->getPort(),
            {{"Content-Type", "application/json"}}
        );

        SimpleResponse response;
        bool sent = false;
        try {
            sent = httpClient_->send(request, response);
        } catch (const std::exception& e) {
            throw domain::TransientNetworkException(std::string("settlement RPC error: ") + e.what());
        }
        if (!sent || response.getStatus() != 200) {
            throw domain::TransientNetworkException(
                "settlement RPC unavailable, status " + std::to_string(response.getStatus()));
        }

        return parseStatus(response.getBody());
    }

    /**
     * @throws domain::TransientNetworkException на ответе, который нельзя разобрать
     */
    static domain::SettlementStatus parseStatus(const std::string& body) {
        try {
            auto json = nlohmann::json::parse(body);
            if (json.contains("error")) {
                throw domain::TransientNetworkException(
                    "settlement RPC error: " + json["error"].value("message", std::string("unknown")));
            }

            const auto& value = json.at("result").at("value");
            if (!value.is_array() || value.empty() || value[0].is_null()) {
                return domain::SettlementStatus::NOT_FOUND;
            }

            const auto& status = value[0];
            if (status.contains("err") && !status["err"].is_null()) {
                return domain::SettlementStatus::FAILED;
            }

            const auto confirmation = status.contains("confirmationStatus") && status["confirmationStatus"].is_string()
                ? status["confirmationStatus"].get<std::string>()
                : std::string("processed");
            if (confirmation == "confirmed" || confirmation == "finalized") {
                return domain::SettlementStatus::CONFIRMED;
            }
            return domain::SettlementStatus::PENDING;

        } catch (const nlohmann::json::exception& e) {
            throw domain::TransientNetworkException(std::string("malformed settlement RPC response: ") + e.what());
        }
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::ISettlementRpcSettings> settings_;
    std::atomic<int64_t> requestId_{0};
};

} // namespace paygate::adapters::secondary
