#include "domain/events/OracleReportEvent.hpp"
#include <nlohmann/json.hpp>

namespace paygate::domain {

std::string OracleReportEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["tool"] = tool;
    j["fingerprint"] = fingerprint;
    j["report"] = report;
    return j.dump();
}

} // namespace paygate::domain
