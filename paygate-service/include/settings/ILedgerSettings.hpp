#pragma once

#include <chrono>
#include <string>

namespace paygate::settings {

class ILedgerSettings {
public:
    virtual ~ILedgerSettings() = default;

    /// Сколько хранить терминальные записи (окно дедупликации)
    virtual std::chrono::seconds getRetention() const = 0;

    virtual std::chrono::milliseconds getJanitorInterval() const = 0;

    /// "memory" или "postgres"
    virtual std::string getStorage() const = 0;
};

} // namespace paygate::settings
