#pragma once

#include "settings/ISettlementRpcSettings.hpp"
#include <cstdlib>
#include <string>

namespace paygate::settings {

/**
 * @brief RPC-узел сети расчётов
 *
 * - SETTLEMENT_RPC_HOST (default: "solana-rpc")
 * - SETTLEMENT_RPC_PORT (default: 8899)
 * - SETTLEMENT_RPC_PATH (default: "/")
 * - SETTLEMENT_POLL_ATTEMPTS (default: 5)
 * - SETTLEMENT_POLL_INTERVAL_MS (default: 500)
 */
class SettlementRpcSettings : public ISettlementRpcSettings {
public:
    std::string getHost() const override {
        const char* host = std::getenv("SETTLEMENT_RPC_HOST");
        return host ? host : "solana-rpc";
    }

    int getPort() const override {
        const char* port = std::getenv("SETTLEMENT_RPC_PORT");
        return port ? std::stoi(port) : 8899;
    }

    std::string getPath() const override {
        const char* path = std::getenv("SETTLEMENT_RPC_PATH");
        return path ? path : "/";
    }

    int getPollAttempts() const override {
        const char* attempts = std::getenv("SETTLEMENT_POLL_ATTEMPTS");
        return attempts ? std::stoi(attempts) : 5;
    }

    std::chrono::milliseconds getPollInterval() const override {
        const char* interval = std::getenv("SETTLEMENT_POLL_INTERVAL_MS");
        return std::chrono::milliseconds(interval ? std::stoll(interval) : 500);
    }
};

} // namespace paygate::settings
