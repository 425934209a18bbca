#pragma once

#include "domain/Timestamp.hpp"
#include <cstdint>
#include <string>

namespace paygate::domain {

/**
 * @brief Платёжное требование из ответа 402
 *
 * Одноразовое: nonce привязывается ровно к одной авторизации.
 * Просроченный challenge (now >= expiresAt) подписывать нельзя.
 */
struct PaymentChallenge {
    std::string scheme = "exact";
    std::string network;
    uint64_t amount = 0;            ///< в атомарных единицах актива
    std::string asset;
    std::string payTo;
    std::string nonce;
    std::string resource;
    std::string description;
    Timestamp expiresAt;

    bool isExpired(const Timestamp& now = Timestamp::now()) const {
        return now >= expiresAt;
    }
};

} // namespace paygate::domain
