#pragma once

#include "domain/SettlementRecord.hpp"
#include <optional>
#include <string>
#include <vector>

namespace paygate::ports::output {

/**
 * @brief Интерфейс хранилища записей леджера
 *
 * Ключ: отпечаток запроса. save() перезаписывает запись целиком (upsert).
 */
class ISettlementRepository {
public:
    virtual ~ISettlementRepository() = default;

    virtual void save(const domain::SettlementRecord& record) = 0;

    virtual std::optional<domain::SettlementRecord> findByFingerprint(const std::string& fingerprint) = 0;

    virtual std::optional<domain::SettlementRecord> findByNonce(const std::string& nonce) = 0;

    virtual std::vector<domain::SettlementRecord> findByStatus(domain::SettlementStatus status) = 0;

    virtual std::vector<domain::SettlementRecord> findAll() = 0;

    /**
     * @return true если запись была удалена
     */
    virtual bool deleteByFingerprint(const std::string& fingerprint) = 0;
};

} // namespace paygate::ports::output
