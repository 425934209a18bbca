#pragma once

#include "domain/OracleRequest.hpp"
#include <string>

namespace paygate::domain {

/**
 * @brief Отпечаток логического вызова: ключ леджера
 *
 * SHA-256 (hex) от метода, host:port, пути и канонических параметров.
 * Одинаковые логические вызовы дают одинаковый отпечаток; платёжные
 * заголовки в расчёт не берутся.
 */
class RequestFingerprint {
public:
    explicit RequestFingerprint(std::string value) : value_(std::move(value)) {}

    static RequestFingerprint of(const OracleRequest& request);

    const std::string& value() const { return value_; }

    /// Первые 12 символов (для логов)
    std::string shortValue() const { return value_.substr(0, 12); }

    bool operator==(const RequestFingerprint& other) const { return value_ == other.value_; }
    bool operator!=(const RequestFingerprint& other) const { return value_ != other.value_; }

private:
    std::string value_;
};

} // namespace paygate::domain
