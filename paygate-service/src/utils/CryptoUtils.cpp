#include "utils/CryptoUtils.hpp"
#include <sodium.h>
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace paygate::utils {

namespace {

const char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int base58Index(char c) {
    const char* pos = std::find(BASE58_ALPHABET, BASE58_ALPHABET + 58, c);
    return pos == BASE58_ALPHABET + 58 ? -1 : static_cast<int>(pos - BASE58_ALPHABET);
}

} // namespace

void CryptoUtils::ensureInitialized() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, []() {
        ok = sodium_init() >= 0;
    });
    if (!ok) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

std::string CryptoUtils::sha256Hex(const std::string& data) {
    ensureInitialized();

    unsigned char hash[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(hash, reinterpret_cast<const unsigned char*>(data.data()), data.size());

    char hex[crypto_hash_sha256_BYTES * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), hash, sizeof(hash));
    return std::string(hex);
}

std::string CryptoUtils::base64Encode(const std::string& data) {
    ensureInitialized();

    const size_t maxLen = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(maxLen, '\0');
    sodium_bin2base64(out.data(), maxLen,
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    out.resize(maxLen - 1);  // без завершающего '\0'
    return out;
}

std::string CryptoUtils::base64Decode(const std::string& encoded) {
    ensureInitialized();

    std::string out(encoded.size(), '\0');
    size_t binLen = 0;
    if (sodium_base642bin(reinterpret_cast<unsigned char*>(out.data()), out.size(),
                          encoded.data(), encoded.size(),
                          nullptr, &binLen, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        throw std::invalid_argument("invalid base64 input");
    }
    out.resize(binLen);
    return out;
}

std::string CryptoUtils::base58Encode(const std::vector<uint8_t>& data) {
    return base58Encode(data.data(), data.size());
}

std::string CryptoUtils::base58Encode(const uint8_t* data, size_t size) {
    size_t zeros = 0;
    while (zeros < size && data[zeros] == 0) {
        ++zeros;
    }

    // log(256) / log(58) ~ 1.37
    std::vector<uint8_t> digits((size - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;

    for (size_t i = zeros; i < size; ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + (digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string result(zeros, '1');
    for (; it != digits.end(); ++it) {
        result += BASE58_ALPHABET[*it];
    }
    return result;
}

std::vector<uint8_t> CryptoUtils::base58Decode(const std::string& encoded) {
    size_t zeros = 0;
    while (zeros < encoded.size() && encoded[zeros] == '1') {
        ++zeros;
    }

    // log(58) / log(256) ~ 0.733
    std::vector<uint8_t> bytes((encoded.size() - zeros) * 733 / 1000 + 1, 0);
    size_t length = 0;

    for (size_t i = zeros; i < encoded.size(); ++i) {
        int carry = base58Index(encoded[i]);
        if (carry < 0) {
            throw std::invalid_argument("invalid base58 character");
        }
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + (bytes.size() - length);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> result(zeros, 0);
    result.insert(result.end(), it, bytes.end());
    return result;
}

std::string CryptoUtils::sign(const std::string& message, const uint8_t* secretKey) {
    ensureInitialized();

    unsigned char signature[crypto_sign_BYTES];
    unsigned long long signatureLen = 0;
    if (crypto_sign_detached(signature, &signatureLen,
                             reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                             secretKey) != 0) {
        throw std::runtime_error("crypto_sign_detached failed");
    }
    return base58Encode(signature, static_cast<size_t>(signatureLen));
}

bool CryptoUtils::verify(const std::string& message,
                         const std::string& signatureBase58,
                         const std::string& publicKeyBase58) {
    ensureInitialized();

    std::vector<uint8_t> signature;
    std::vector<uint8_t> publicKey;
    try {
        signature = base58Decode(signatureBase58);
        publicKey = base58Decode(publicKeyBase58);
    } catch (const std::invalid_argument&) {
        return false;
    }

    if (signature.size() != crypto_sign_BYTES || publicKey.size() != crypto_sign_PUBLICKEYBYTES) {
        return false;
    }

    return crypto_sign_verify_detached(signature.data(),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       publicKey.data()) == 0;
}

} // namespace paygate::utils
