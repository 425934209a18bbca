#include "application/SettlementVerifier.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/PaymentException.hpp"
#include "utils/CryptoUtils.hpp"
#include <iostream>

namespace paygate::application {

using domain::SettlementStatus;

SettlementVerifier::SettlementVerifier(std::shared_ptr<ports::output::ISettlementRpcClient> rpcClient,
                                       std::shared_ptr<settings::ISettlementRpcSettings> settings)
    : rpcClient_(std::move(rpcClient))
    , settings_(std::move(settings))
{
    std::cout << "[SettlementVerifier] Created, pollAttempts=" << settings_->getPollAttempts()
              << " interval=" << settings_->getPollInterval().count() << "ms" << std::endl;
}

SettlementStatus SettlementVerifier::verify(const domain::PaymentAuthorization& authorization,
                                            const std::string& expectedNonce,
                                            const domain::Deadline& deadline) const {
    if (!isBound(authorization, expectedNonce)) {
        return SettlementStatus::FAILED;
    }

    RetryPolicy policy(settings_->getPollAttempts(), settings_->getPollInterval());
    std::optional<SettlementStatus> lastSeen;
    int polls = 0;

    for (int attempt = 1; attempt <= policy.maxAttempts(); ++attempt) {
        if (attempt > 1 && !policy.waitBefore(attempt, deadline)) {
            std::cout << "[SettlementVerifier] Deadline reached after " << polls
                      << " polls for nonce=" << expectedNonce << std::endl;
            break;
        }
        ++polls;

        auto status = poll(authorization);
        if (status) {
            lastSeen = status;
            if (*status == SettlementStatus::CONFIRMED || *status == SettlementStatus::FAILED) {
                std::cout << "[SettlementVerifier] nonce=" << expectedNonce << " -> "
                          << domain::toString(*status) << " (poll " << attempt << ")" << std::endl;
                return *status;
            }
        }
    }

    auto result = lastSeen.value_or(SettlementStatus::PENDING);
    // Окно опроса не отработано целиком: отсутствие транзакции ещё ничего не значит
    if (result == SettlementStatus::NOT_FOUND && polls < policy.maxAttempts()) {
        result = SettlementStatus::PENDING;
    }
    std::cout << "[SettlementVerifier] nonce=" << expectedNonce << " unresolved -> "
              << domain::toString(result) << std::endl;
    return result;
}

SettlementStatus SettlementVerifier::checkOnce(const domain::PaymentAuthorization& authorization,
                                               const std::string& expectedNonce) const {
    if (!isBound(authorization, expectedNonce)) {
        return SettlementStatus::FAILED;
    }
    return poll(authorization).value_or(SettlementStatus::PENDING);
}

bool SettlementVerifier::isBound(const domain::PaymentAuthorization& authorization,
                                 const std::string& expectedNonce) const {
    if (authorization.nonce != expectedNonce) {
        std::cerr << "[SettlementVerifier] Nonce mismatch: expected=" << expectedNonce
                  << " got=" << authorization.nonce << std::endl;
        return false;
    }
    if (!utils::CryptoUtils::verify(authorization.canonicalMessage(), authorization.signature,
                                    authorization.payer)) {
        std::cerr << "[SettlementVerifier] Signature does not match payer for nonce="
                  << expectedNonce << std::endl;
        return false;
    }
    return true;
}

std::optional<SettlementStatus> SettlementVerifier::poll(const domain::PaymentAuthorization& authorization) const {
    try {
        return rpcClient_->getSignatureStatus(authorization.transactionId());
    } catch (const domain::TransientNetworkException& e) {
        std::cerr << "[SettlementVerifier] RPC unreachable: " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace paygate::application
