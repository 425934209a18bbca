#pragma once

#include "DomainEvent.hpp"
#include <cstdint>
#include <string>

namespace paygate::domain {

/**
 * @brief Событие: платный (или бесплатный) вызов оракула завершился успехом
 */
struct CallSucceededEvent : public DomainEvent {
    std::string fingerprint;
    std::string resource;
    bool paid = false;
    std::string nonce;
    std::string network;
    std::string asset;
    uint64_t amount = 0;

    CallSucceededEvent() : DomainEvent("call.succeeded") {}

    std::string toJson() const override;
};

} // namespace paygate::domain
