#pragma once

#include "domain/Deadline.hpp"
#include "domain/SettlementRecord.hpp"
#include "domain/Timestamp.hpp"
#include "ports/output/ISettlementRepository.hpp"
#include "settings/ILedgerSettings.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace paygate::application {

/**
 * @brief Леджер идемпотентности: отпечаток -> исход расчёта
 *
 * Единственное разделяемое изменяемое состояние процесса. Внедряется
 * через DI, не синглтон.
 *
 * Single-flight: acquire() выдаёт аренду отпечатка. Первый вызывающий
 * ведёт вызов, остальные ждут освобождения аренды или своего срока.
 * Мьютекс держится только на время решения "вести или ждать".
 *
 * Вытеснение: терминальные записи старше окна хранения удаляются;
 * pending-записи и арендованные отпечатки не трогаются.
 */
class IdempotencyLedger {
public:
    /**
     * @brief RAII-аренда отпечатка (только перемещение)
     */
    class Lease {
    public:
        Lease(Lease&& other) noexcept
            : ledger_(other.ledger_), fingerprint_(std::move(other.fingerprint_)) {
            other.ledger_ = nullptr;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        ~Lease() {
            if (ledger_) {
                ledger_->release(fingerprint_);
            }
        }

        const std::string& fingerprint() const { return fingerprint_; }

    private:
        friend class IdempotencyLedger;

        Lease(IdempotencyLedger* ledger, std::string fingerprint)
            : ledger_(ledger), fingerprint_(std::move(fingerprint)) {}

        IdempotencyLedger* ledger_;
        std::string fingerprint_;
    };

    IdempotencyLedger(std::shared_ptr<ports::output::ISettlementRepository> repository,
                      std::shared_ptr<settings::ILedgerSettings> settings);

    /**
     * @brief Взять аренду отпечатка, дождавшись текущего владельца
     * @throws domain::TransientNetworkException если срок истёк в ожидании
     */
    Lease acquire(const std::string& fingerprint, const domain::Deadline& deadline);

    std::optional<domain::SettlementRecord> get(const std::string& fingerprint) const;

    /**
     * @brief Сохранить запись под отпечатком (upsert)
     */
    void put(const std::string& fingerprint, const domain::SettlementRecord& record);

    std::optional<domain::SettlementRecord> findByNonce(const std::string& nonce) const;

    std::vector<domain::SettlementRecord> list(const std::optional<domain::SettlementStatus>& status) const;

    /**
     * @brief Удалить терминальные записи старше окна хранения
     * @return Количество удалённых записей
     */
    size_t evictExpired(const domain::Timestamp& now = domain::Timestamp::now());

    bool isLeased(const std::string& fingerprint) const;

    std::chrono::seconds retention() const { return retention_; }

private:
    void release(const std::string& fingerprint);

    std::shared_ptr<ports::output::ISettlementRepository> repository_;
    std::chrono::seconds retention_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::unordered_set<std::string> inFlight_;
};

} // namespace paygate::application
