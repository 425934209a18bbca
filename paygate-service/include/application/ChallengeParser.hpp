#pragma once

#include "domain/PaymentChallenge.hpp"
#include "domain/PaymentException.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <string>

namespace paygate::application {

/**
 * @brief Разбор тела ответа 402 (x402 v1) в PaymentChallenge
 *
 * Берётся первый элемент accepts[] со схемой "exact".
 * Любое отклонение от формата: ProtocolViolationException.
 *
 * @example
 * ```json
 * {"x402Version":1,"error":"payment required","accepts":[{
 *   "scheme":"exact","network":"solana-devnet","maxAmountRequired":"10000",
 *   "asset":"<mint>","payTo":"<address>","resource":"http://oracle/api",
 *   "maxTimeoutSeconds":60,"extra":{"nonce":"n-1","expiresAt":1767225600}}]}
 * ```
 */
class ChallengeParser {
public:
    static constexpr int64_t DEFAULT_TIMEOUT_SECONDS = 60;
    static constexpr int64_t MAX_TIMEOUT_SECONDS = 86400;
    static constexpr int64_t MAX_EXPIRES_AT = 4102444800;     ///< 2100-01-01T00:00:00Z

    /**
     * @param body Тело ответа 402
     * @param fallbackResource URI запроса, если в challenge нет resource
     * @param now Текущее время (для expiresAt по maxTimeoutSeconds)
     */
    static domain::PaymentChallenge parse(const std::string& body,
                                          const std::string& fallbackResource,
                                          const domain::Timestamp& now = domain::Timestamp::now()) {
        nlohmann::json root;
        try {
            root = nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error&) {
            throw domain::ProtocolViolationException("402 body is not valid JSON");
        }

        if (!root.is_object() || !root.contains("accepts") || !root["accepts"].is_array()) {
            throw domain::ProtocolViolationException("402 body has no accepts[] array");
        }

        try {
            for (const auto& entry : root["accepts"]) {
                if (entry.is_object() && optionalString(entry, "scheme") == "exact") {
                    return parseEntry(entry, fallbackResource, now);
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw domain::ProtocolViolationException(std::string("malformed challenge: ") + e.what());
        }

        throw domain::ProtocolViolationException("402 body offers no supported payment scheme");
    }

private:
    static domain::PaymentChallenge parseEntry(const nlohmann::json& entry,
                                               const std::string& fallbackResource,
                                               const domain::Timestamp& now) {
        domain::PaymentChallenge challenge;
        challenge.scheme = "exact";
        challenge.network = requireString(entry, "network");
        challenge.amount = parseAmount(entry);
        challenge.asset = requireString(entry, "asset");
        challenge.payTo = requireString(entry, "payTo");
        challenge.resource = optionalString(entry, "resource");
        if (challenge.resource.empty()) {
            challenge.resource = fallbackResource;
        }
        challenge.description = optionalString(entry, "description");

        const nlohmann::json extra = entry.contains("extra") && entry["extra"].is_object()
            ? entry["extra"]
            : nlohmann::json::object();

        if (!extra.contains("nonce") || !extra["nonce"].is_string() ||
            extra["nonce"].get<std::string>().empty()) {
            throw domain::ProtocolViolationException("challenge has no nonce");
        }
        challenge.nonce = extra["nonce"].get<std::string>();

        if (extra.contains("expiresAt")) {
            if (!extra["expiresAt"].is_number_integer()) {
                throw domain::ProtocolViolationException("challenge expiresAt is not a unix timestamp");
            }
            const auto expiresAt = extra["expiresAt"].get<int64_t>();
            if (expiresAt <= 0 || expiresAt > MAX_EXPIRES_AT) {
                throw domain::ProtocolViolationException(
                    "challenge expiresAt out of range: " + std::to_string(expiresAt));
            }
            challenge.expiresAt = domain::Timestamp::fromUnixSeconds(expiresAt);
        } else {
            int64_t timeout = DEFAULT_TIMEOUT_SECONDS;
            if (entry.contains("maxTimeoutSeconds")) {
                if (!entry["maxTimeoutSeconds"].is_number_integer()) {
                    throw domain::ProtocolViolationException("challenge maxTimeoutSeconds is not an integer");
                }
                timeout = entry["maxTimeoutSeconds"].get<int64_t>();
                if (timeout <= 0 || timeout > MAX_TIMEOUT_SECONDS) {
                    throw domain::ProtocolViolationException(
                        "challenge maxTimeoutSeconds out of range: " + std::to_string(timeout));
                }
            }
            challenge.expiresAt = now.plusSeconds(timeout);
        }

        return challenge;
    }

    // Необязательное строковое поле; поле другого типа: нарушение протокола
    static std::string optionalString(const nlohmann::json& entry, const char* field) {
        if (!entry.contains(field) || entry[field].is_null()) {
            return "";
        }
        if (!entry[field].is_string()) {
            throw domain::ProtocolViolationException(std::string("challenge field is not a string: ") + field);
        }
        return entry[field].get<std::string>();
    }

    static std::string requireString(const nlohmann::json& entry, const char* field) {
        if (!entry.contains(field) || !entry[field].is_string() || entry[field].get<std::string>().empty()) {
            throw domain::ProtocolViolationException(std::string("challenge field missing: ") + field);
        }
        return entry[field].get<std::string>();
    }

    // maxAmountRequired приходит строкой атомарных единиц; число тоже принимаем
    static uint64_t parseAmount(const nlohmann::json& entry) {
        if (!entry.contains("maxAmountRequired")) {
            throw domain::ProtocolViolationException("challenge field missing: maxAmountRequired");
        }
        const auto& value = entry["maxAmountRequired"];
        if (value.is_number_unsigned()) {
            return value.get<uint64_t>();
        }
        if (!value.is_string()) {
            throw domain::ProtocolViolationException("challenge maxAmountRequired has wrong type");
        }

        const auto text = value.get<std::string>();
        if (text.empty() || text.size() > 20) {
            throw domain::ProtocolViolationException("challenge maxAmountRequired is not an atomic amount");
        }
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw domain::ProtocolViolationException("challenge maxAmountRequired is not an atomic amount");
            }
        }
        try {
            return std::stoull(text);
        } catch (const std::out_of_range&) {
            throw domain::ProtocolViolationException("challenge maxAmountRequired overflows");
        }
    }
};

} // namespace paygate::application
