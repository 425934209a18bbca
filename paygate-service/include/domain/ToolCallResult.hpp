#pragma once

#include "domain/enums/ErrorCategory.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace paygate::domain {

/**
 * @brief Результат вызова инструмента-оракула
 *
 * Либо успех с payload, либо ровно одна типизированная ошибка.
 */
struct ToolCallResult {
    bool success = false;
    std::string tool;
    nlohmann::json payload;
    ErrorCategory errorCategory = ErrorCategory::NONE;
    std::string message;
    std::string fingerprint;
    bool paid = false;

    static ToolCallResult ok(const std::string& tool, nlohmann::json payload,
                             const std::string& fingerprint, bool paid) {
        ToolCallResult r;
        r.success = true;
        r.tool = tool;
        r.payload = std::move(payload);
        r.fingerprint = fingerprint;
        r.paid = paid;
        return r;
    }

    static ToolCallResult failed(const std::string& tool, ErrorCategory category,
                                 const std::string& message) {
        ToolCallResult r;
        r.success = false;
        r.tool = tool;
        r.errorCategory = category;
        r.message = message;
        return r;
    }

    /// Повтор безопасен: леджер не допустит второй оплаты
    bool retrySafe() const {
        return !success && isRetrySafe(errorCategory);
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["success"] = success;
        j["tool"] = tool;
        if (success) {
            j["payload"] = payload;
            j["fingerprint"] = fingerprint;
            j["paid"] = paid;
        } else {
            j["error"] = toString(errorCategory);
            j["message"] = message;
            j["retry_safe"] = retrySafe();
        }
        return j;
    }
};

} // namespace paygate::domain
