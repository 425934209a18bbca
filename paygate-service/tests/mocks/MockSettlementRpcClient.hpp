#pragma once

#include "domain/PaymentException.hpp"
#include "ports/output/ISettlementRpcClient.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace paygate::tests {

/**
 * @brief Mock RPC сети расчётов
 *
 * Отдаёт статусы из очереди, затем повторяет последний (или defaultStatus).
 * nullopt в очереди означает недоступный RPC.
 */
class MockSettlementRpcClient : public ports::output::ISettlementRpcClient {
public:
    void setDefaultStatus(std::optional<domain::SettlementStatus> status) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultStatus_ = status;
    }

    void enqueue(std::optional<domain::SettlementStatus> status) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(status);
    }

    domain::SettlementStatus getSignatureStatus(const std::string& signature) override {
        ++callCount_;
        std::optional<domain::SettlementStatus> next;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastSignature_ = signature;
            if (!script_.empty()) {
                next = script_.front();
                script_.pop_front();
            } else {
                next = defaultStatus_;
            }
        }
        if (!next) {
            throw domain::TransientNetworkException("mock rpc unreachable");
        }
        return *next;
    }

    int callCount() const { return callCount_.load(); }

    std::string lastSignature() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastSignature_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::optional<domain::SettlementStatus>> script_;
    std::optional<domain::SettlementStatus> defaultStatus_ = domain::SettlementStatus::CONFIRMED;
    std::string lastSignature_;
    std::atomic<int> callCount_{0};
};

} // namespace paygate::tests
