#pragma once

#include "settings/IOracleSettings.hpp"
#include <cstdlib>
#include <string>

namespace paygate::settings {

/**
 * @brief Адреса оракулов
 *
 * Читает из ENV:
 * - VISION_ORACLE_HOST / VISION_ORACLE_PORT (default: vision-oracle:8080)
 * - REPO_ORACLE_HOST / REPO_ORACLE_PORT (default: repo-oracle:8080)
 * - CHAIN_ORACLE_HOST / CHAIN_ORACLE_PORT (default: chain-oracle:8080)
 */
class OracleSettings : public IOracleSettings {
public:
    std::string getVisionHost() const override { return getEnvOrDefault("VISION_ORACLE_HOST", "vision-oracle"); }
    int getVisionPort() const override { return std::stoi(getEnvOrDefault("VISION_ORACLE_PORT", "8080")); }

    std::string getRepoHost() const override { return getEnvOrDefault("REPO_ORACLE_HOST", "repo-oracle"); }
    int getRepoPort() const override { return std::stoi(getEnvOrDefault("REPO_ORACLE_PORT", "8080")); }

    std::string getChainHost() const override { return getEnvOrDefault("CHAIN_ORACLE_HOST", "chain-oracle"); }
    int getChainPort() const override { return std::stoi(getEnvOrDefault("CHAIN_ORACLE_PORT", "8080")); }

private:
    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace paygate::settings
