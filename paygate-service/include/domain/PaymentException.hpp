#pragma once

#include "enums/ErrorCategory.hpp"
#include <stdexcept>
#include <string>

namespace paygate::domain {

/**
 * @brief Базовое исключение платёжного протокола
 *
 * Каждое исключение несёт категорию: на границе адаптера она
 * превращается в ToolCallResult с ошибкой, без частичного успеха.
 */
class PaymentException : public std::runtime_error {
public:
    PaymentException(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Кривой challenge или неожиданный ответ ресурса. Не повторяется.
 */
class ProtocolViolationException : public PaymentException {
public:
    explicit ProtocolViolationException(const std::string& message)
        : PaymentException(ErrorCategory::PROTOCOL_VIOLATION, message) {}
};

enum class AuthorizationFailure {
    SPEND_LIMIT_EXCEEDED,
    SIGNING_FAILURE,
    CHALLENGE_EXPIRED,
    UNSUPPORTED_NETWORK
};

inline std::string toString(AuthorizationFailure reason) {
    switch (reason) {
        case AuthorizationFailure::SPEND_LIMIT_EXCEEDED: return "SpendLimitExceeded";
        case AuthorizationFailure::SIGNING_FAILURE: return "SigningFailure";
        case AuthorizationFailure::CHALLENGE_EXPIRED: return "ChallengeExpired";
        case AuthorizationFailure::UNSUPPORTED_NETWORK: return "UnsupportedNetwork";
        default: return "Unknown";
    }
}

/**
 * @brief Отказ в подписи авторизации (фатально для текущего вызова)
 */
class AuthorizationException : public PaymentException {
public:
    AuthorizationException(AuthorizationFailure reason, const std::string& message)
        : PaymentException(ErrorCategory::AUTHORIZATION, toString(reason) + ": " + message)
        , reason_(reason) {}

    AuthorizationFailure reason() const { return reason_; }

private:
    AuthorizationFailure reason_;
};

class TransientNetworkException : public PaymentException {
public:
    explicit TransientNetworkException(const std::string& message)
        : PaymentException(ErrorCategory::TRANSIENT_NETWORK, message) {}
};

/**
 * @brief Верификатор не получил окончательный статус за отведённое время.
 * Запись леджера остаётся pending для последующей сверки.
 */
class SettlementAmbiguousException : public PaymentException {
public:
    explicit SettlementAmbiguousException(const std::string& message)
        : PaymentException(ErrorCategory::SETTLEMENT_AMBIGUOUS, message) {}
};

class ValidationException : public PaymentException {
public:
    explicit ValidationException(const std::string& message)
        : PaymentException(ErrorCategory::VALIDATION, message) {}
};

} // namespace paygate::domain
