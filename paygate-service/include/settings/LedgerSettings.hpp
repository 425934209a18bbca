#pragma once

#include "settings/ILedgerSettings.hpp"
#include <cstdlib>
#include <string>

namespace paygate::settings {

/**
 * @brief Настройки леджера
 *
 * - LEDGER_RETENTION_SECONDS (default: 3600)
 * - LEDGER_JANITOR_INTERVAL_MS (default: 60000)
 * - LEDGER_STORAGE (default: "memory")
 */
class LedgerSettings : public ILedgerSettings {
public:
    LedgerSettings() {
        if (const char* retention = std::getenv("LEDGER_RETENTION_SECONDS")) {
            retention_ = std::chrono::seconds(std::stoll(retention));
        }
        if (const char* interval = std::getenv("LEDGER_JANITOR_INTERVAL_MS")) {
            janitorInterval_ = std::chrono::milliseconds(std::stoll(interval));
        }
        if (const char* storage = std::getenv("LEDGER_STORAGE")) {
            storage_ = storage;
        }
    }

    std::chrono::seconds getRetention() const override { return retention_; }
    std::chrono::milliseconds getJanitorInterval() const override { return janitorInterval_; }
    std::string getStorage() const override { return storage_; }

private:
    std::chrono::seconds retention_{3600};
    std::chrono::milliseconds janitorInterval_{60000};
    std::string storage_ = "memory";
};

} // namespace paygate::settings
