#pragma once

#include "domain/enums/SettlementStatus.hpp"
#include <string>

namespace paygate::ports::output {

/**
 * @brief Выходной порт: RPC-узел сети расчётов
 */
class ISettlementRpcClient {
public:
    virtual ~ISettlementRpcClient() = default;

    /**
     * @brief Статус транзакции по идентификатору
     * @return PENDING, CONFIRMED, FAILED или NOT_FOUND
     * @throws domain::TransientNetworkException если узел недоступен
     */
    virtual domain::SettlementStatus getSignatureStatus(const std::string& transactionId) = 0;
};

} // namespace paygate::ports::output
