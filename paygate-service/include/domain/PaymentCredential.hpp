#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace paygate::domain {

/**
 * @brief Ключевая пара ed25519 плательщика
 *
 * Загружается один раз и дальше только читается.
 * Секретный ключ не логируется и не сохраняется; деструктор затирает память.
 */
class PaymentCredential {
public:
    using SecretKey = std::array<uint8_t, 64>;
    using PublicKey = std::array<uint8_t, 32>;
    using Seed = std::array<uint8_t, 32>;

    static PaymentCredential fromSeed(const Seed& seed);

    /**
     * @brief Из base58: 64-байтная пара (формат solana-keygen) или 32-байтный seed
     * @throws std::invalid_argument при неверной длине или алфавите
     */
    static PaymentCredential fromBase58(const std::string& encoded);

    PaymentCredential(const PaymentCredential& other) = default;
    PaymentCredential& operator=(const PaymentCredential& other) = default;
    ~PaymentCredential();

    const SecretKey& secretKey() const { return secretKey_; }
    const PublicKey& publicKey() const { return publicKey_; }

    /// base58 публичного ключа
    std::string address() const;

private:
    PaymentCredential(const SecretKey& secretKey, const PublicKey& publicKey)
        : secretKey_(secretKey), publicKey_(publicKey) {}

    SecretKey secretKey_{};
    PublicKey publicKey_{};
};

} // namespace paygate::domain
