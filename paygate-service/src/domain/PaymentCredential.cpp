#include "domain/PaymentCredential.hpp"
#include "utils/CryptoUtils.hpp"
#include <sodium.h>
#include <algorithm>
#include <stdexcept>

namespace paygate::domain {

PaymentCredential PaymentCredential::fromSeed(const Seed& seed) {
    utils::CryptoUtils::ensureInitialized();

    SecretKey secretKey{};
    PublicKey publicKey{};
    if (crypto_sign_seed_keypair(publicKey.data(), secretKey.data(), seed.data()) != 0) {
        throw std::runtime_error("crypto_sign_seed_keypair failed");
    }
    PaymentCredential credential(secretKey, publicKey);
    sodium_memzero(secretKey.data(), secretKey.size());
    return credential;
}

PaymentCredential PaymentCredential::fromBase58(const std::string& encoded) {
    auto bytes = utils::CryptoUtils::base58Decode(encoded);

    if (bytes.size() == 32) {
        Seed seed{};
        std::copy(bytes.begin(), bytes.end(), seed.begin());
        sodium_memzero(bytes.data(), bytes.size());
        auto credential = fromSeed(seed);
        sodium_memzero(seed.data(), seed.size());
        return credential;
    }

    if (bytes.size() == 64) {
        // Формат solana-keygen: seed(32) + публичный ключ(32).
        // Публичный ключ пересчитываем из seed, чтобы пара была согласована.
        Seed seed{};
        std::copy(bytes.begin(), bytes.begin() + 32, seed.begin());
        sodium_memzero(bytes.data(), bytes.size());
        auto credential = fromSeed(seed);
        sodium_memzero(seed.data(), seed.size());
        return credential;
    }

    sodium_memzero(bytes.data(), bytes.size());
    throw std::invalid_argument("payer key must decode to 32 or 64 bytes, got " +
                                std::to_string(bytes.size()));
}

PaymentCredential::~PaymentCredential() {
    sodium_memzero(secretKey_.data(), secretKey_.size());
}

std::string PaymentCredential::address() const {
    return utils::CryptoUtils::base58Encode(publicKey_.data(), publicKey_.size());
}

} // namespace paygate::domain
