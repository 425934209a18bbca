#pragma once

#include <string>

namespace paygate::settings {

class IOracleSettings {
public:
    virtual ~IOracleSettings() = default;

    virtual std::string getVisionHost() const = 0;
    virtual int getVisionPort() const = 0;

    virtual std::string getRepoHost() const = 0;
    virtual int getRepoPort() const = 0;

    virtual std::string getChainHost() const = 0;
    virtual int getChainPort() const = 0;
};

} // namespace paygate::settings
