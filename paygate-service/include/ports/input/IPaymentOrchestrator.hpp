#pragma once

#include "domain/CallOutcome.hpp"
#include "domain/Deadline.hpp"
#include "domain/OracleRequest.hpp"

namespace paygate::ports::input {

/**
 * @brief Входной порт: платёжно-защищённый HTTP-вызов
 */
class IPaymentOrchestrator {
public:
    virtual ~IPaymentOrchestrator() = default;

    /**
     * @brief Провести один логический вызов до успеха или типизированной ошибки
     * @throws domain::PaymentException (и наследники)
     */
    virtual domain::CallOutcome execute(const domain::OracleRequest& request,
                                        const domain::Deadline& deadline) = 0;
};

} // namespace paygate::ports::input
