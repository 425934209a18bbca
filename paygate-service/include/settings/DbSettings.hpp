#pragma once

#include <cstdlib>
#include <string>

namespace paygate::settings {

/**
 * @brief Подключение к PostgreSQL для хранилища леджера (LEDGER_STORAGE=postgres)
 *
 * - PAYGATE_DB_HOST (default: "paygate-postgres")
 * - PAYGATE_DB_PORT (default: 5432)
 * - PAYGATE_DB_NAME (default: "paygate_db")
 * - PAYGATE_DB_USER (default: "paygate_user")
 * - PAYGATE_DB_PASSWORD
 * - PAYGATE_DB_CONNECT_TIMEOUT (секунды, default: 5)
 */
class DbSettings {
public:
    DbSettings()
        : host_(getEnvOrDefault("PAYGATE_DB_HOST", "paygate-postgres"))
        , port_(std::stoi(getEnvOrDefault("PAYGATE_DB_PORT", "5432")))
        , name_(getEnvOrDefault("PAYGATE_DB_NAME", "paygate_db"))
        , user_(getEnvOrDefault("PAYGATE_DB_USER", "paygate_user"))
        , password_(getEnvOrDefault("PAYGATE_DB_PASSWORD", ""))
        , connectTimeout_(std::stoi(getEnvOrDefault("PAYGATE_DB_CONNECT_TIMEOUT", "5")))
    {}

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }

    /// libpq keyword/value строка; пароль в логи не выводить
    std::string getConnectionString() const {
        std::string conn = "host=" + host_ + " port=" + std::to_string(port_) +
                           " dbname=" + name_ + " user=" + user_ +
                           " connect_timeout=" + std::to_string(connectTimeout_);
        if (!password_.empty()) {
            conn += " password=" + password_;
        }
        return conn;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    int connectTimeout_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace paygate::settings
