#pragma once

#include "domain/OracleResponse.hpp"
#include "domain/PaymentCredential.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace paygate::tests {

constexpr const char* TEST_ASSET = "4zMMC9srt5Ri5X14GAgXhaHii3GnPAEERYPJgZJDncDU";
constexpr const char* TEST_PAY_TO = "9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin";

/// Детерминированный ключ плательщика
inline domain::PaymentCredential testCredential(uint8_t fill = 7) {
    domain::PaymentCredential::Seed seed{};
    seed.fill(fill);
    return domain::PaymentCredential::fromSeed(seed);
}

inline nlohmann::json challengeEntry(const std::string& nonce,
                                     uint64_t amount = 10000,
                                     const std::string& network = "solana-devnet",
                                     int64_t expiresInSeconds = 300) {
    return nlohmann::json{
        {"scheme", "exact"},
        {"network", network},
        {"maxAmountRequired", std::to_string(amount)},
        {"asset", TEST_ASSET},
        {"payTo", TEST_PAY_TO},
        {"resource", "http://oracle:8080/api"},
        {"description", "oracle call"},
        {"maxTimeoutSeconds", 60},
        {"extra", {
            {"nonce", nonce},
            {"expiresAt", domain::Timestamp::now().plusSeconds(expiresInSeconds).toUnixSeconds()}
        }}
    };
}

inline std::string challengeBody(const std::string& nonce,
                                 uint64_t amount = 10000,
                                 const std::string& network = "solana-devnet",
                                 int64_t expiresInSeconds = 300) {
    nlohmann::json body{
        {"x402Version", 1},
        {"error", "X-PAYMENT header is required"},
        {"accepts", nlohmann::json::array({challengeEntry(nonce, amount, network, expiresInSeconds)})}
    };
    return body.dump();
}

inline domain::OracleResponse paymentRequired(const std::string& nonce,
                                              uint64_t amount = 10000,
                                              const std::string& network = "solana-devnet",
                                              int64_t expiresInSeconds = 300) {
    return domain::OracleResponse{402, challengeBody(nonce, amount, network, expiresInSeconds)};
}

} // namespace paygate::tests
