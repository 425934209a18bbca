#include "application/PaymentOrchestrator.hpp"
#include "application/ChallengeParser.hpp"
#include "application/PaymentCodec.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/PaymentException.hpp"
#include "domain/events/CallSucceededEvent.hpp"
#include <iostream>
#include <stdexcept>

namespace paygate::application {

using domain::CallState;
using domain::SettlementStatus;

namespace {

std::string tag(const domain::RequestFingerprint& fingerprint) {
    return "[PaymentOrchestrator] " + fingerprint.shortValue() + " ";
}

} // namespace

PaymentOrchestrator::PaymentOrchestrator(std::shared_ptr<ports::output::IOracleTransport> transport,
                                         std::shared_ptr<PaymentAuthorizer> authorizer,
                                         std::shared_ptr<SettlementVerifier> verifier,
                                         std::shared_ptr<IdempotencyLedger> ledger,
                                         std::shared_ptr<domain::PaymentCredential> credential,
                                         std::shared_ptr<ports::output::IEventPublisher> publisher,
                                         std::shared_ptr<settings::IPaymentSettings> settings)
    : transport_(std::move(transport))
    , authorizer_(std::move(authorizer))
    , verifier_(std::move(verifier))
    , ledger_(std::move(ledger))
    , credential_(std::move(credential))
    , publisher_(std::move(publisher))
    , settings_(std::move(settings))
{
    std::cout << "[PaymentOrchestrator] Created, payer=" << credential_->address() << std::endl;
}

bool PaymentOrchestrator::isAllowedTransition(CallState from, CallState to) {
    switch (from) {
        case CallState::INITIATED:
            return to == CallState::AWAITING_CHALLENGE || to == CallState::RESUBMITTING ||
                   to == CallState::VERIFYING || to == CallState::FAILED;
        case CallState::AWAITING_CHALLENGE:
            return to == CallState::SUCCEEDED || to == CallState::AUTHORIZING || to == CallState::FAILED;
        case CallState::AUTHORIZING:
            return to == CallState::RESUBMITTING || to == CallState::FAILED;
        case CallState::RESUBMITTING:
            return to == CallState::SUCCEEDED || to == CallState::AWAITING_CHALLENGE ||
                   to == CallState::VERIFYING || to == CallState::FAILED;
        case CallState::VERIFYING:
            return to == CallState::RESUBMITTING || to == CallState::AWAITING_CHALLENGE ||
                   to == CallState::FAILED;
        default:
            return false;
    }
}

void PaymentOrchestrator::transition(CallContext& ctx, CallState to) const {
    if (!isAllowedTransition(ctx.state, to)) {
        throw std::logic_error("illegal call state transition " + domain::toString(ctx.state) +
                               " -> " + domain::toString(to));
    }
    std::cout << tag(ctx.fingerprint) << domain::toString(ctx.state) << " -> "
              << domain::toString(to) << std::endl;
    ctx.state = to;
}

domain::CallOutcome PaymentOrchestrator::execute(const domain::OracleRequest& request,
                                                 const domain::Deadline& deadline) {
    CallContext ctx(request, deadline);
    std::cout << tag(ctx.fingerprint) << request.method << " " << request.resourceUri() << std::endl;

    if (deadline.expired()) {
        throw domain::TransientNetworkException("deadline expired before the call started");
    }

    auto lease = ledger_->acquire(ctx.fingerprint.value(), deadline);

    try {
        start(ctx);
        while (!domain::isTerminal(ctx.state)) {
            switch (ctx.state) {
                case CallState::AWAITING_CHALLENGE: awaitChallenge(ctx); break;
                case CallState::AUTHORIZING: authorizeChallenge(ctx); break;
                case CallState::RESUBMITTING: resubmit(ctx); break;
                case CallState::VERIFYING: verifySettlement(ctx); break;
                default:
                    throw std::logic_error("no handler for state " + domain::toString(ctx.state));
            }
        }
    } catch (const domain::PaymentException& e) {
        std::cerr << tag(ctx.fingerprint) << "failed in " << domain::toString(ctx.state) << ": "
                  << domain::toString(e.category()) << " " << e.what() << std::endl;
        if (!domain::isTerminal(ctx.state)) {
            transition(ctx, CallState::FAILED);
        }
        throw;
    }

    publishSuccess(ctx);
    return domain::CallOutcome{*ctx.response, ctx.fingerprint.value(), ctx.paid, ctx.reused};
}

void PaymentOrchestrator::start(CallContext& ctx) {
    auto existing = ledger_->get(ctx.fingerprint.value());

    if (existing && existing->isConfirmed()) {
        ctx.record = existing;
        if (!existing->authorization.isExpired()) {
            std::cout << tag(ctx.fingerprint) << "reusing confirmed payment nonce="
                      << existing->nonce << std::endl;
            ctx.reused = true;
            transition(ctx, CallState::RESUBMITTING);
            return;
        }
        std::cout << tag(ctx.fingerprint) << "cached proof past validBefore, nonce="
                  << existing->nonce << std::endl;
        markRecord(ctx, SettlementStatus::EXPIRED);
        ctx.record.reset();
    } else if (existing && existing->isPending()) {
        std::cout << tag(ctx.fingerprint) << "pending payment nonce=" << existing->nonce
                  << ", verifying before anything else" << std::endl;
        ctx.record = existing;
        ctx.recoveringPending = true;
        transition(ctx, CallState::VERIFYING);
        return;
    }

    transition(ctx, CallState::AWAITING_CHALLENGE);
}

void PaymentOrchestrator::awaitChallenge(CallContext& ctx) {
    if (!ctx.response) {
        ctx.response = sendUnpaid(ctx);
    }

    const auto response = *ctx.response;
    if (response.isSuccess()) {
        ctx.paid = false;
        transition(ctx, CallState::SUCCEEDED);
        return;
    }

    if (!response.isPaymentRequired()) {
        throw domain::ProtocolViolationException(
            "unexpected status " + std::to_string(response.status) + " from " + ctx.request.resourceUri());
    }

    ctx.challenge = ChallengeParser::parse(response.body, ctx.request.resourceUri());
    ctx.response.reset();

    std::cout << tag(ctx.fingerprint) << "challenge nonce=" << ctx.challenge->nonce
              << " amount=" << ctx.challenge->amount << " network=" << ctx.challenge->network << std::endl;
    transition(ctx, CallState::AUTHORIZING);
}

void PaymentOrchestrator::authorizeChallenge(CallContext& ctx) {
    if (ctx.deadline.expired()) {
        throw domain::TransientNetworkException("deadline expired before signing");
    }

    // Запись заводится по challenge: pending после подписи, failed при отказе
    auto now = domain::Timestamp::now();
    domain::SettlementRecord record;
    record.fingerprint = ctx.fingerprint.value();
    record.nonce = ctx.challenge->nonce;
    record.createdAt = now;
    record.updatedAt = now;

    try {
        record.authorization = authorizer_->authorize(*ctx.challenge, *credential_);
    } catch (const domain::AuthorizationException& e) {
        record.authorization = PaymentAuthorizer::unsignedFor(*ctx.challenge, *credential_);
        record.status = SettlementStatus::FAILED;
        ledger_->put(ctx.fingerprint.value(), record);
        std::cerr << tag(ctx.fingerprint) << "authorization refused, nonce=" << record.nonce
                  << " recorded as failed: " << domain::toString(e.reason()) << std::endl;
        throw;
    }
    record.status = SettlementStatus::PENDING;

    // pending пишется до отправки доказательства
    ledger_->put(ctx.fingerprint.value(), record);
    ctx.record = record;
    ctx.reused = false;

    transition(ctx, CallState::RESUBMITTING);
}

void PaymentOrchestrator::resubmit(CallContext& ctx) {
    if (++ctx.resubmissions > settings_->getSendAttempts()) {
        throw domain::TransientNetworkException(
            "resource did not answer after payment " + domain::toString(ctx.record->status) +
            " for nonce " + ctx.record->nonce + "; retry reuses the ledger record");
    }

    if (ctx.deadline.expired()) {
        transition(ctx, CallState::VERIFYING);
        return;
    }

    const auto paidRequest = ctx.request.withHeader(
        PaymentCodec::HEADER_NAME, PaymentCodec::toHeader(ctx.record->authorization));

    domain::OracleResponse response;
    try {
        response = transport_->send(paidRequest, ctx.deadline);
    } catch (const domain::TransientNetworkException& e) {
        std::cerr << tag(ctx.fingerprint) << "resubmission failed: " << e.what() << std::endl;
        transition(ctx, CallState::VERIFYING);
        return;
    }

    if (response.isSuccess()) {
        if (!ctx.record->isConfirmed()) {
            markRecord(ctx, SettlementStatus::CONFIRMED);
        }
        ctx.response = response;
        ctx.paid = true;
        transition(ctx, CallState::SUCCEEDED);
        return;
    }

    if (response.isPaymentRequired()) {
        const std::string nonce = ctx.record->nonce;
        if (ctx.reused) {
            std::cerr << tag(ctx.fingerprint) << "cached proof rejected, nonce=" << nonce << std::endl;
            markRecord(ctx, SettlementStatus::EXPIRED);
        } else {
            std::cerr << tag(ctx.fingerprint) << "proof rejected, nonce=" << nonce << std::endl;
            markRecord(ctx, SettlementStatus::FAILED);
        }
        ctx.record.reset();
        ctx.reused = false;

        if (++ctx.challengeRounds > MAX_CHALLENGE_ROUNDS) {
            throw domain::ProtocolViolationException("payment proof rejected again, last nonce " + nonce);
        }
        ctx.response = response;
        transition(ctx, CallState::AWAITING_CHALLENGE);
        return;
    }

    std::cerr << tag(ctx.fingerprint) << "status " << response.status
              << " after payment, verifying settlement" << std::endl;
    transition(ctx, CallState::VERIFYING);
}

void PaymentOrchestrator::verifySettlement(CallContext& ctx) {
    if (ctx.deadline.expired()) {
        failAfterDeadline(ctx);
    }

    const auto nonce = ctx.record->nonce;
    auto status = verifier_->verify(ctx.record->authorization, nonce, ctx.deadline);

    switch (status) {
        case SettlementStatus::CONFIRMED:
            markRecord(ctx, SettlementStatus::CONFIRMED);
            if (ctx.recoveringPending) {
                ctx.recoveringPending = false;
                ctx.reused = true;
            }
            // та же авторизация, без новой подписи
            transition(ctx, CallState::RESUBMITTING);
            return;

        case SettlementStatus::FAILED:
        case SettlementStatus::NOT_FOUND:
            markRecord(ctx, SettlementStatus::FAILED);
            if (ctx.recoveringPending) {
                ctx.recoveringPending = false;
                ctx.record.reset();
                transition(ctx, CallState::AWAITING_CHALLENGE);
                return;
            }
            throw domain::TransientNetworkException(
                "settlement " + domain::toString(status) + " for nonce " + nonce + ", nothing was paid");

        default:
            throw domain::SettlementAmbiguousException("settlement for nonce " + nonce + " is still pending");
    }
}

domain::OracleResponse PaymentOrchestrator::sendUnpaid(const CallContext& ctx) {
    auto request = ctx.request;
    request.headers.erase(PaymentCodec::HEADER_NAME);

    RetryPolicy policy(settings_->getSendAttempts(), settings_->getBackoff());
    std::string lastError = "deadline expired";

    for (int attempt = 1; attempt <= policy.maxAttempts(); ++attempt) {
        if (attempt > 1 && !policy.waitBefore(attempt, ctx.deadline)) {
            break;
        }
        if (ctx.deadline.expired()) {
            break;
        }

        try {
            auto response = transport_->send(request, ctx.deadline);
            if (!response.isServerError()) {
                return response;
            }
            lastError = "status " + std::to_string(response.status);
        } catch (const domain::TransientNetworkException& e) {
            lastError = e.what();
        }

        std::cerr << tag(ctx.fingerprint) << "attempt " << attempt << "/" << policy.maxAttempts()
                  << " failed: " << lastError << std::endl;
    }

    throw domain::TransientNetworkException("oracle unavailable before payment: " + lastError);
}

void PaymentOrchestrator::failAfterDeadline(CallContext& ctx) {
    const auto nonce = ctx.record->nonce;
    auto status = verifier_->checkOnce(ctx.record->authorization, nonce);

    if (status == SettlementStatus::CONFIRMED) {
        markRecord(ctx, SettlementStatus::CONFIRMED);
        throw domain::TransientNetworkException(
            "deadline expired; payment for nonce " + nonce + " confirmed, retry reuses it");
    }
    if (status == SettlementStatus::FAILED) {
        markRecord(ctx, SettlementStatus::FAILED);
        throw domain::TransientNetworkException(
            "deadline expired; settlement for nonce " + nonce + " failed, nothing was paid");
    }
    throw domain::SettlementAmbiguousException(
        "deadline expired; settlement for nonce " + nonce + " unresolved");
}

void PaymentOrchestrator::markRecord(CallContext& ctx, SettlementStatus status) {
    ctx.record = ctx.record->withStatus(status);
    ledger_->put(ctx.fingerprint.value(), *ctx.record);
}

void PaymentOrchestrator::publishSuccess(const CallContext& ctx) {
    domain::CallSucceededEvent event;
    event.fingerprint = ctx.fingerprint.value();
    event.resource = ctx.request.resourceUri();
    event.paid = ctx.paid;
    if (ctx.paid && ctx.record) {
        const auto& auth = ctx.record->authorization;
        event.nonce = auth.nonce;
        event.network = auth.network;
        event.asset = auth.asset;
        event.amount = auth.amount;
    }

    try {
        publisher_->publish(event.eventType, event.toJson());
    } catch (const std::exception& e) {
        std::cerr << tag(ctx.fingerprint) << "call.succeeded not published: " << e.what() << std::endl;
    }
}

} // namespace paygate::application
