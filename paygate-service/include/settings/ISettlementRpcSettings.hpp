#pragma once

#include <chrono>
#include <string>

namespace paygate::settings {

class ISettlementRpcSettings {
public:
    virtual ~ISettlementRpcSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual std::string getPath() const = 0;

    virtual int getPollAttempts() const = 0;
    virtual std::chrono::milliseconds getPollInterval() const = 0;
};

} // namespace paygate::settings
