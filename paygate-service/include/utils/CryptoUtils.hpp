#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace paygate::utils {

/**
 * @brief Криптографические утилиты поверх libsodium
 *
 * ed25519 подпись/проверка, SHA-256, base64 (стандартный алфавит) и base58
 * (алфавит Bitcoin/Solana, в libsodium его нет).
 * Перед первым вызовом libsodium инициализируется один раз.
 */
class CryptoUtils {
public:
    /**
     * @throws std::runtime_error если sodium_init() не удался
     */
    static void ensureInitialized();

    static std::string sha256Hex(const std::string& data);

    static std::string base64Encode(const std::string& data);

    /**
     * @throws std::invalid_argument на некорректном base64
     */
    static std::string base64Decode(const std::string& encoded);

    static std::string base58Encode(const std::vector<uint8_t>& data);
    static std::string base58Encode(const uint8_t* data, size_t size);

    /**
     * @throws std::invalid_argument на символе вне алфавита
     */
    static std::vector<uint8_t> base58Decode(const std::string& encoded);

    /**
     * @brief Detached-подпись ed25519
     * @param secretKey 64 байта (seed + публичный ключ)
     * @return base58 подпись
     * @throws std::runtime_error если libsodium вернул ошибку
     */
    static std::string sign(const std::string& message, const uint8_t* secretKey);

    /**
     * @brief Проверить base58 подпись base58 публичным ключом
     * @return false при неверной подписи или кривой кодировке
     */
    static bool verify(const std::string& message,
                       const std::string& signatureBase58,
                       const std::string& publicKeyBase58);
};

} // namespace paygate::utils
