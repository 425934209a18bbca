#pragma once

#include <string>

namespace paygate::domain {

/**
 * @brief Категория ошибки логического вызова
 *
 * Повторять вызов снаружи безопасно только для TRANSIENT_NETWORK
 * и SETTLEMENT_AMBIGUOUS: леджер не даст заплатить второй раз.
 */
enum class ErrorCategory {
    NONE,
    PROTOCOL_VIOLATION,
    AUTHORIZATION,
    TRANSIENT_NETWORK,
    SETTLEMENT_AMBIGUOUS,
    VALIDATION
};

inline std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::PROTOCOL_VIOLATION: return "PROTOCOL_VIOLATION";
        case ErrorCategory::AUTHORIZATION: return "AUTHORIZATION_ERROR";
        case ErrorCategory::TRANSIENT_NETWORK: return "TRANSIENT_NETWORK_ERROR";
        case ErrorCategory::SETTLEMENT_AMBIGUOUS: return "SETTLEMENT_AMBIGUOUS";
        case ErrorCategory::VALIDATION: return "VALIDATION_ERROR";
        default: return "UNKNOWN";
    }
}

inline bool isRetrySafe(ErrorCategory category) {
    return category == ErrorCategory::TRANSIENT_NETWORK
        || category == ErrorCategory::SETTLEMENT_AMBIGUOUS;
}

} // namespace paygate::domain
