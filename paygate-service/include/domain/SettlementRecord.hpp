#pragma once

#include "domain/PaymentAuthorization.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/SettlementStatus.hpp"
#include <string>

namespace paygate::domain {

/**
 * @brief Запись леджера: исход расчёта для одного отпечатка
 *
 * Создаётся при первой авторизации, дальше обновляется на месте
 * до терминального статуса. Pending-записи не вытесняются.
 */
struct SettlementRecord {
    std::string fingerprint;
    std::string nonce;
    PaymentAuthorization authorization;
    SettlementStatus status = SettlementStatus::PENDING;
    Timestamp createdAt;
    Timestamp updatedAt;

    SettlementRecord withStatus(SettlementStatus newStatus,
                                const Timestamp& now = Timestamp::now()) const {
        SettlementRecord copy = *this;
        copy.status = newStatus;
        copy.updatedAt = now;
        return copy;
    }

    bool isPending() const { return status == SettlementStatus::PENDING; }
    bool isConfirmed() const { return status == SettlementStatus::CONFIRMED; }
};

} // namespace paygate::domain
