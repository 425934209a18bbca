#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace paygate::settings {

/**
 * @brief Источник ключа плательщика
 *
 * PAYER_SECRET_KEY: base58 (64-байтная пара или 32-байтный seed).
 * Значение не логируется.
 */
class WalletSettings {
public:
    std::string getSecretKey() const {
        const char* key = std::getenv("PAYER_SECRET_KEY");
        if (!key || std::string(key).empty()) {
            throw std::runtime_error("PAYER_SECRET_KEY is not set");
        }
        return key;
    }
};

} // namespace paygate::settings
