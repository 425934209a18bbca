#pragma once

#include "domain/Deadline.hpp"
#include "domain/PaymentAuthorization.hpp"
#include "domain/enums/SettlementStatus.hpp"
#include "ports/output/ISettlementRpcClient.hpp"
#include "settings/ISettlementRpcSettings.hpp"
#include <memory>
#include <optional>
#include <string>

namespace paygate::application {

/**
 * @brief Проверка расчёта по подписанной авторизации
 *
 * Сначала локально: nonce авторизации должен совпадать с ожидаемым,
 * подпись должна сходиться с ключом плательщика. Иначе FAILED без RPC.
 * Затем опрос RPC с ограниченным числом попыток и экспоненциальной паузой
 * в пределах срока вызова.
 *
 * Итог опроса:
 * - CONFIRMED / FAILED сразу, как только узел их вернул;
 * - NOT_FOUND, только если выполнены все попытки опроса и узел так и не
 *   увидел транзакцию;
 * - PENDING, если узел недоступен, транзакция ещё не подтверждена или
 *   срок вызова оборвал опрос раньше последней попытки.
 *
 * Повторный вызов с теми же аргументами безопасен.
 */
class SettlementVerifier {
public:
    SettlementVerifier(std::shared_ptr<ports::output::ISettlementRpcClient> rpcClient,
                       std::shared_ptr<settings::ISettlementRpcSettings> settings);

    domain::SettlementStatus verify(const domain::PaymentAuthorization& authorization,
                                    const std::string& expectedNonce,
                                    const domain::Deadline& deadline) const;

    /**
     * @brief Один опрос без пауз (после истечения срока вызова)
     */
    domain::SettlementStatus checkOnce(const domain::PaymentAuthorization& authorization,
                                       const std::string& expectedNonce) const;

private:
    bool isBound(const domain::PaymentAuthorization& authorization, const std::string& expectedNonce) const;

    /// nullopt: узел недоступен
    std::optional<domain::SettlementStatus> poll(const domain::PaymentAuthorization& authorization) const;

    std::shared_ptr<ports::output::ISettlementRpcClient> rpcClient_;
    std::shared_ptr<settings::ISettlementRpcSettings> settings_;
};

} // namespace paygate::application
