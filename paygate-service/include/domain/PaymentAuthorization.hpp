#pragma once

#include "domain/Timestamp.hpp"
#include <cstdint>
#include <string>

namespace paygate::domain {

/**
 * @brief Подписанное доказательство оплаты
 *
 * Подпись (ed25519, base58) покрывает canonicalMessage() и тем самым
 * привязана к одному nonce. Она же служит идентификатором транзакции
 * при проверке расчёта.
 */
struct PaymentAuthorization {
    std::string scheme = "exact";
    std::string network;
    std::string payer;              ///< base58 публичный ключ плательщика
    std::string payTo;
    std::string asset;
    uint64_t amount = 0;
    std::string nonce;
    std::string resource;
    Timestamp validBefore;
    std::string signature;

    /**
     * @brief Сообщение, которое подписывает плательщик
     *
     * Формат: x402-exact/v1 и затем каждое поле как <длина>:<байты>;
     * в порядке network, asset, payTo, amount, nonce, resource, validBefore, payer.
     * Префикс длины не даёт сдвинуть границу между полями, поэтому
     * разделители внутри значений безопасны.
     */
    std::string canonicalMessage() const {
        std::string message = "x402-" + scheme + "/v1";
        for (const auto& field : {network, asset, payTo, std::to_string(amount), nonce, resource,
                                  std::to_string(validBefore.toUnixSeconds()), payer}) {
            message += std::to_string(field.size());
            message += ':';
            message += field;
            message += ';';
        }
        return message;
    }

    const std::string& transactionId() const { return signature; }

    bool isExpired(const Timestamp& now = Timestamp::now()) const {
        return now >= validBefore;
    }

    bool operator==(const PaymentAuthorization& other) const {
        return canonicalMessage() == other.canonicalMessage() && signature == other.signature;
    }
};

} // namespace paygate::domain
