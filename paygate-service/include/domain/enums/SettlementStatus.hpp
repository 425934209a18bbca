#pragma once

#include <string>

namespace paygate::domain {

/**
 * @brief Статус расчёта по платёжной авторизации
 *
 * PENDING/CONFIRMED/FAILED/EXPIRED: статусы записи леджера.
 * NOT_FOUND возвращает только RPC/верификатор: транзакция в сети не найдена.
 */
enum class SettlementStatus {
    PENDING,
    CONFIRMED,
    FAILED,
    EXPIRED,
    NOT_FOUND
};

inline std::string toString(SettlementStatus status) {
    switch (status) {
        case SettlementStatus::PENDING: return "pending";
        case SettlementStatus::CONFIRMED: return "confirmed";
        case SettlementStatus::FAILED: return "failed";
        case SettlementStatus::EXPIRED: return "expired";
        case SettlementStatus::NOT_FOUND: return "not_found";
        default: return "unknown";
    }
}

inline SettlementStatus parseSettlementStatus(const std::string& str) {
    if (str == "confirmed") return SettlementStatus::CONFIRMED;
    if (str == "failed") return SettlementStatus::FAILED;
    if (str == "expired") return SettlementStatus::EXPIRED;
    if (str == "not_found") return SettlementStatus::NOT_FOUND;
    return SettlementStatus::PENDING;
}

/**
 * @brief Терминальный статус записи (может быть вытеснен по retention)
 */
inline bool isTerminal(SettlementStatus status) {
    return status == SettlementStatus::CONFIRMED
        || status == SettlementStatus::FAILED
        || status == SettlementStatus::EXPIRED;
}

} // namespace paygate::domain
