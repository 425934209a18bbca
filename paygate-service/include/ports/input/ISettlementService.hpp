#pragma once

#include "domain/SettlementRecord.hpp"
#include <optional>
#include <string>
#include <vector>

namespace paygate::ports::input {

/**
 * @brief Входной порт: обслуживание леджера (просмотр, сверка, вытеснение)
 */
class ISettlementService {
public:
    virtual ~ISettlementService() = default;

    virtual std::vector<domain::SettlementRecord> listRecords(
        const std::optional<domain::SettlementStatus>& status) = 0;

    virtual std::optional<domain::SettlementRecord> getRecord(const std::string& fingerprint) = 0;

    /**
     * @brief Сверить pending-запись с сетью
     * @return Обновлённая запись или nullopt, если записи нет
     */
    virtual std::optional<domain::SettlementRecord> reconcile(const std::string& fingerprint) = 0;

    /**
     * @brief Сверить все pending-записи
     * @return Сколько записей получили терминальный статус
     */
    virtual size_t reconcilePending() = 0;

    virtual size_t evictExpired() = 0;
};

} // namespace paygate::ports::input
