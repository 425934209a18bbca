#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace paygate::settings {

/**
 * @brief Параметры платёжного протокола
 */
class IPaymentSettings {
public:
    virtual ~IPaymentSettings() = default;

    /// Единственная сеть, в которой разрешено платить
    virtual std::string getNetwork() const = 0;

    /// Максимальная сумма одного платежа в атомарных единицах
    virtual uint64_t getMaxSpendAtomic() const = 0;

    /// Попыток отправки до появления авторизации
    virtual int getSendAttempts() const = 0;

    virtual std::chrono::milliseconds getBackoff() const = 0;

    /// Срок одного логического вызова
    virtual std::chrono::milliseconds getCallTimeout() const = 0;
};

} // namespace paygate::settings
