#pragma once

#include "settings/IPaymentSettings.hpp"
#include <cstdlib>
#include <string>

namespace paygate::settings {

/**
 * @brief Параметры платёжного протокола из ENV
 *
 * - PAYMENT_NETWORK (default: "solana-devnet")
 * - PAYMENT_MAX_SPEND_ATOMIC (default: 1000000)
 * - PAYMENT_SEND_ATTEMPTS (default: 3)
 * - PAYMENT_BACKOFF_MS (default: 200)
 * - PAYMENT_CALL_TIMEOUT_MS (default: 30000)
 */
class PaymentSettings : public IPaymentSettings {
public:
    PaymentSettings() {
        if (const char* network = std::getenv("PAYMENT_NETWORK")) {
            network_ = network;
        }
        if (const char* maxSpend = std::getenv("PAYMENT_MAX_SPEND_ATOMIC")) {
            maxSpendAtomic_ = std::stoull(maxSpend);
        }
        if (const char* attempts = std::getenv("PAYMENT_SEND_ATTEMPTS")) {
            sendAttempts_ = std::stoi(attempts);
        }
        if (const char* backoff = std::getenv("PAYMENT_BACKOFF_MS")) {
            backoff_ = std::chrono::milliseconds(std::stoll(backoff));
        }
        if (const char* timeout = std::getenv("PAYMENT_CALL_TIMEOUT_MS")) {
            callTimeout_ = std::chrono::milliseconds(std::stoll(timeout));
        }
    }

    std::string getNetwork() const override { return network_; }
    uint64_t getMaxSpendAtomic() const override { return maxSpendAtomic_; }
    int getSendAttempts() const override { return sendAttempts_; }
    std::chrono::milliseconds getBackoff() const override { return backoff_; }
    std::chrono::milliseconds getCallTimeout() const override { return callTimeout_; }

private:
    std::string network_ = "solana-devnet";
    uint64_t maxSpendAtomic_ = 1000000;
    int sendAttempts_ = 3;
    std::chrono::milliseconds backoff_{200};
    std::chrono::milliseconds callTimeout_{30000};
};

} // namespace paygate::settings
