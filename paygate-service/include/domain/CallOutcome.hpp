#pragma once

#include "domain/OracleResponse.hpp"
#include <string>

namespace paygate::domain {

/**
 * @brief Итог логического вызова через оркестратор
 */
struct CallOutcome {
    OracleResponse response;
    std::string fingerprint;
    bool paid = false;          ///< ответ получен по платёжному доказательству
    bool reusedPayment = false; ///< доказательство взято из леджера, новой оплаты не было
};

} // namespace paygate::domain
