#pragma once

#include "application/IdempotencyLedger.hpp"
#include "application/PaymentAuthorizer.hpp"
#include "application/SettlementVerifier.hpp"
#include "domain/PaymentChallenge.hpp"
#include "domain/PaymentCredential.hpp"
#include "domain/RequestFingerprint.hpp"
#include "domain/enums/CallState.hpp"
#include "ports/input/IPaymentOrchestrator.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IOracleTransport.hpp"
#include "settings/IPaymentSettings.hpp"
#include <memory>
#include <optional>

namespace paygate::application {

/**
 * @brief Оркестратор платёжно-защищённого вызова
 *
 * Ведёт один логический вызов по конечному автомату:
 *
 *   INITIATED -> AWAITING_CHALLENGE -> AUTHORIZING -> RESUBMITTING -> VERIFYING
 *             -> {SUCCEEDED | FAILED}
 *
 * Гарантии:
 * - не больше одной оплаты на отпечаток (аренда леджера + проверка записи);
 * - подпись только в ответ на реальный 402;
 * - после подписи любой повтор идёт через проверку расчёта, новая
 *   авторизация не создаётся;
 * - неоднозначный расчёт даёт SettlementAmbiguous, запись остаётся pending.
 *
 * Переходы проверяются таблицей, недопустимый переход: std::logic_error.
 */
class PaymentOrchestrator : public ports::input::IPaymentOrchestrator {
public:
    PaymentOrchestrator(std::shared_ptr<ports::output::IOracleTransport> transport,
                        std::shared_ptr<PaymentAuthorizer> authorizer,
                        std::shared_ptr<SettlementVerifier> verifier,
                        std::shared_ptr<IdempotencyLedger> ledger,
                        std::shared_ptr<domain::PaymentCredential> credential,
                        std::shared_ptr<ports::output::IEventPublisher> publisher,
                        std::shared_ptr<settings::IPaymentSettings> settings);

    domain::CallOutcome execute(const domain::OracleRequest& request,
                                const domain::Deadline& deadline) override;

    static bool isAllowedTransition(domain::CallState from, domain::CallState to);

    /// Сколько раз допускается новый challenge после отказа в доказательстве
    static constexpr int MAX_CHALLENGE_ROUNDS = 1;

private:
    struct CallContext {
        domain::OracleRequest request;
        domain::RequestFingerprint fingerprint;
        domain::Deadline deadline;
        domain::CallState state = domain::CallState::INITIATED;

        std::optional<domain::OracleResponse> response;     ///< последний ответ ресурса
        std::optional<domain::PaymentChallenge> challenge;
        std::optional<domain::SettlementRecord> record;

        bool paid = false;
        bool reused = false;            ///< доказательство из леджера
        bool recoveringPending = false; ///< pending-запись найдена при старте
        int challengeRounds = 0;
        int resubmissions = 0;

        CallContext(const domain::OracleRequest& req, const domain::Deadline& dl)
            : request(req), fingerprint(domain::RequestFingerprint::of(req)), deadline(dl) {}
    };

    void transition(CallContext& ctx, domain::CallState to) const;

    void start(CallContext& ctx);
    void awaitChallenge(CallContext& ctx);
    void authorizeChallenge(CallContext& ctx);
    void resubmit(CallContext& ctx);
    void verifySettlement(CallContext& ctx);

    /// Запрос без оплаты с повторами (до появления авторизации)
    domain::OracleResponse sendUnpaid(const CallContext& ctx);

    /// Срок истёк после подписи: один опрос и ошибка таймаута
    [[noreturn]] void failAfterDeadline(CallContext& ctx);

    void markRecord(CallContext& ctx, domain::SettlementStatus status);
    void publishSuccess(const CallContext& ctx);

    std::shared_ptr<ports::output::IOracleTransport> transport_;
    std::shared_ptr<PaymentAuthorizer> authorizer_;
    std::shared_ptr<SettlementVerifier> verifier_;
    std::shared_ptr<IdempotencyLedger> ledger_;
    std::shared_ptr<domain::PaymentCredential> credential_;
    std::shared_ptr<ports::output::IEventPublisher> publisher_;
    std::shared_ptr<settings::IPaymentSettings> settings_;
};

} // namespace paygate::application
