#pragma once

#include "application/IdempotencyLedger.hpp"
#include "application/SettlementVerifier.hpp"
#include "domain/PaymentException.hpp"
#include "ports/input/ISettlementService.hpp"
#include "settings/IPaymentSettings.hpp"
#include <iostream>
#include <memory>

namespace paygate::application {

/**
 * @brief Обслуживание леджера: просмотр, сверка pending-записей, вытеснение
 *
 * Сверка берёт аренду отпечатка, поэтому не пересекается с вызовом,
 * который сейчас ведёт этот отпечаток.
 */
class SettlementService : public ports::input::ISettlementService {
public:
    SettlementService(std::shared_ptr<IdempotencyLedger> ledger,
                      std::shared_ptr<SettlementVerifier> verifier,
                      std::shared_ptr<settings::IPaymentSettings> settings)
        : ledger_(std::move(ledger))
        , verifier_(std::move(verifier))
        , settings_(std::move(settings))
    {
        std::cout << "[SettlementService] Created" << std::endl;
    }

    std::vector<domain::SettlementRecord> listRecords(
        const std::optional<domain::SettlementStatus>& status) override {
        return ledger_->list(status);
    }

    std::optional<domain::SettlementRecord> getRecord(const std::string& fingerprint) override {
        return ledger_->get(fingerprint);
    }

    /**
     * @throws domain::TransientNetworkException если отпечаток занят дольше срока
     */
    std::optional<domain::SettlementRecord> reconcile(const std::string& fingerprint) override {
        auto deadline = domain::Deadline::after(settings_->getCallTimeout());
        auto lease = ledger_->acquire(fingerprint, deadline);

        auto record = ledger_->get(fingerprint);
        if (!record || !record->isPending()) {
            return record;
        }

        auto status = verifier_->verify(record->authorization, record->nonce, deadline);
        switch (status) {
            case domain::SettlementStatus::CONFIRMED:
                ledger_->put(fingerprint, record->withStatus(domain::SettlementStatus::CONFIRMED));
                break;
            case domain::SettlementStatus::FAILED:
            case domain::SettlementStatus::NOT_FOUND:
                ledger_->put(fingerprint, record->withStatus(domain::SettlementStatus::FAILED));
                break;
            default:
                std::cout << "[SettlementService] " << fingerprint.substr(0, 12)
                          << " still pending" << std::endl;
                break;
        }
        return ledger_->get(fingerprint);
    }

    size_t reconcilePending() override {
        size_t resolved = 0;
        for (const auto& record : ledger_->list(domain::SettlementStatus::PENDING)) {
            try {
                auto updated = reconcile(record.fingerprint);
                if (updated && !updated->isPending()) {
                    ++resolved;
                }
            } catch (const domain::TransientNetworkException& e) {
                std::cerr << "[SettlementService] Skipped " << record.fingerprint.substr(0, 12)
                          << ": " << e.what() << std::endl;
            }
        }
        return resolved;
    }

    size_t evictExpired() override {
        return ledger_->evictExpired();
    }

private:
    std::shared_ptr<IdempotencyLedger> ledger_;
    std::shared_ptr<SettlementVerifier> verifier_;
    std::shared_ptr<settings::IPaymentSettings> settings_;
};

} // namespace paygate::application
