#pragma once

#include "domain/PaymentAuthorization.hpp"
#include "domain/PaymentChallenge.hpp"
#include "domain/PaymentCredential.hpp"
#include "domain/PaymentException.hpp"
#include "settings/IPaymentSettings.hpp"
#include "utils/CryptoUtils.hpp"
#include <iostream>
#include <memory>

namespace paygate::application {

/**
 * @brief Подписывает платёжную авторизацию под challenge
 *
 * Без сетевого ввода-вывода и без состояния, кроме настроек.
 * Подпись ed25519 детерминирована: одинаковые challenge и ключ
 * дают одинаковую авторизацию.
 */
class PaymentAuthorizer {
public:
    explicit PaymentAuthorizer(std::shared_ptr<settings::IPaymentSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PaymentAuthorizer] Created, network=" << settings_->getNetwork()
                  << " maxSpend=" << settings_->getMaxSpendAtomic() << std::endl;
    }

    /**
     * @brief Подписать авторизацию
     *
     * @throws domain::AuthorizationException
     *   - CHALLENGE_EXPIRED: now >= expiresAt
     *   - UNSUPPORTED_NETWORK: сеть challenge не совпадает с настроенной
     *   - SPEND_LIMIT_EXCEEDED: сумма выше лимита (не урезается)
     *   - SIGNING_FAILURE: ошибка libsodium
     */
    domain::PaymentAuthorization authorize(const domain::PaymentChallenge& challenge,
                                           const domain::PaymentCredential& credential,
                                           const domain::Timestamp& now = domain::Timestamp::now()) const {
        if (challenge.isExpired(now)) {
            throw domain::AuthorizationException(
                domain::AuthorizationFailure::CHALLENGE_EXPIRED,
                "challenge " + challenge.nonce + " expired at " + challenge.expiresAt.toString());
        }

        if (challenge.network != settings_->getNetwork()) {
            throw domain::AuthorizationException(
                domain::AuthorizationFailure::UNSUPPORTED_NETWORK,
                "network " + challenge.network + " is not " + settings_->getNetwork());
        }

        if (challenge.amount > settings_->getMaxSpendAtomic()) {
            std::cerr << "[PaymentAuthorizer] Refused nonce=" << challenge.nonce
                      << " amount=" << challenge.amount
                      << " limit=" << settings_->getMaxSpendAtomic() << std::endl;
            throw domain::AuthorizationException(
                domain::AuthorizationFailure::SPEND_LIMIT_EXCEEDED,
                "amount " + std::to_string(challenge.amount) + " exceeds limit " +
                std::to_string(settings_->getMaxSpendAtomic()));
        }

        auto auth = unsignedFor(challenge, credential);
        try {
            auth.signature = utils::CryptoUtils::sign(auth.canonicalMessage(), credential.secretKey().data());
        } catch (const std::runtime_error& e) {
            throw domain::AuthorizationException(domain::AuthorizationFailure::SIGNING_FAILURE, e.what());
        }

        std::cout << "[PaymentAuthorizer] Signed nonce=" << auth.nonce
                  << " amount=" << auth.amount << " payTo=" << auth.payTo << std::endl;
        return auth;
    }

    /**
     * @brief Поля авторизации по challenge, без подписи
     *
     * Для записи в журнал, когда подписать не удалось.
     */
    static domain::PaymentAuthorization unsignedFor(const domain::PaymentChallenge& challenge,
                                                    const domain::PaymentCredential& credential) {
        domain::PaymentAuthorization auth;
        auth.scheme = challenge.scheme;
        auth.network = challenge.network;
        auth.payer = credential.address();
        auth.payTo = challenge.payTo;
        auth.asset = challenge.asset;
        auth.amount = challenge.amount;
        auth.nonce = challenge.nonce;
        auth.resource = challenge.resource;
        auth.validBefore = challenge.expiresAt;
        return auth;
    }

private:
    std::shared_ptr<settings::IPaymentSettings> settings_;
};

} // namespace paygate::application
