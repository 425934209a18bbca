#pragma once

#include <string>

namespace paygate::domain {

/**
 * @brief Состояние логического вызова в платёжном протоколе
 */
enum class CallState {
    INITIATED,
    AWAITING_CHALLENGE,
    AUTHORIZING,
    RESUBMITTING,
    VERIFYING,
    SUCCEEDED,
    FAILED
};

inline std::string toString(CallState state) {
    switch (state) {
        case CallState::INITIATED: return "INITIATED";
        case CallState::AWAITING_CHALLENGE: return "AWAITING_CHALLENGE";
        case CallState::AUTHORIZING: return "AUTHORIZING";
        case CallState::RESUBMITTING: return "RESUBMITTING";
        case CallState::VERIFYING: return "VERIFYING";
        case CallState::SUCCEEDED: return "SUCCEEDED";
        case CallState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline bool isTerminal(CallState state) {
    return state == CallState::SUCCEEDED || state == CallState::FAILED;
}

} // namespace paygate::domain
