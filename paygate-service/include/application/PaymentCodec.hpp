#pragma once

#include "domain/PaymentAuthorization.hpp"
#include "domain/PaymentException.hpp"
#include "utils/CryptoUtils.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace paygate::application {

/**
 * @brief Кодек платёжного доказательства
 *
 * JSON x402 v1 и заголовок X-PAYMENT (base64 от того же JSON).
 * Тот же JSON хранится в леджере (колонка authorization).
 */
class PaymentCodec {
public:
    static constexpr const char* HEADER_NAME = "X-PAYMENT";
    static constexpr int X402_VERSION = 1;

    static nlohmann::json toJson(const domain::PaymentAuthorization& auth) {
        nlohmann::json j;
        j["x402Version"] = X402_VERSION;
        j["scheme"] = auth.scheme;
        j["network"] = auth.network;
        j["payload"] = {
            {"signature", auth.signature},
            {"authorization", {
                {"from", auth.payer},
                {"to", auth.payTo},
                {"value", std::to_string(auth.amount)},
                {"asset", auth.asset},
                {"nonce", auth.nonce},
                {"resource", auth.resource},
                {"validBefore", auth.validBefore.toUnixSeconds()}
            }}
        };
        return j;
    }

    /**
     * @throws domain::ProtocolViolationException на неполном или кривом JSON
     */
    static domain::PaymentAuthorization fromJson(const nlohmann::json& j) {
        try {
            const auto& payload = j.at("payload");
            const auto& a = payload.at("authorization");

            domain::PaymentAuthorization auth;
            auth.scheme = j.at("scheme").get<std::string>();
            auth.network = j.at("network").get<std::string>();
            auth.signature = payload.at("signature").get<std::string>();
            auth.payer = a.at("from").get<std::string>();
            auth.payTo = a.at("to").get<std::string>();
            auth.amount = std::stoull(a.at("value").get<std::string>());
            auth.asset = a.at("asset").get<std::string>();
            auth.nonce = a.at("nonce").get<std::string>();
            auth.resource = a.value("resource", "");
            auth.validBefore = domain::Timestamp::fromUnixSeconds(a.at("validBefore").get<int64_t>());
            return auth;
        } catch (const nlohmann::json::exception& e) {
            throw domain::ProtocolViolationException(std::string("malformed payment payload: ") + e.what());
        } catch (const std::logic_error& e) {
            throw domain::ProtocolViolationException(std::string("malformed payment amount: ") + e.what());
        }
    }

    static std::string toHeader(const domain::PaymentAuthorization& auth) {
        return utils::CryptoUtils::base64Encode(toJson(auth).dump());
    }

    static domain::PaymentAuthorization fromHeader(const std::string& header) {
        std::string decoded;
        try {
            decoded = utils::CryptoUtils::base64Decode(header);
        } catch (const std::invalid_argument&) {
            throw domain::ProtocolViolationException("X-PAYMENT header is not base64");
        }
        try {
            return fromJson(nlohmann::json::parse(decoded));
        } catch (const nlohmann::json::parse_error&) {
            throw domain::ProtocolViolationException("X-PAYMENT header is not JSON");
        }
    }
};

} // namespace paygate::application
