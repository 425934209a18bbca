#include "domain/events/CallSucceededEvent.hpp"
#include <nlohmann/json.hpp>

namespace paygate::domain {

std::string CallSucceededEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["fingerprint"] = fingerprint;
    j["resource"] = resource;
    j["paid"] = paid;
    if (paid) {
        j["nonce"] = nonce;
        j["network"] = network;
        j["asset"] = asset;
        j["amount"] = std::to_string(amount);
    }
    return j.dump();
}

} // namespace paygate::domain
