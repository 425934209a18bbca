#pragma once

#include "ThreadSafeMap.hpp"
#include "ports/output/ISettlementRepository.hpp"
#include <algorithm>
#include <iostream>

namespace paygate::adapters::secondary {

/**
 * @brief In-memory хранилище леджера поверх ThreadSafeMap
 *
 * Каждая запись хранится как неизменяемая версия: save() подменяет
 * указатель целиком, читатели видят согласованную запись.
 */
class InMemorySettlementRepository : public ports::output::ISettlementRepository {
public:
    InMemorySettlementRepository() {
        std::cout << "[InMemorySettlementRepository] Created" << std::endl;
    }

    void save(const domain::SettlementRecord& record) override {
        records_.insert(record.fingerprint, std::make_shared<domain::SettlementRecord>(record));
    }

    std::optional<domain::SettlementRecord> findByFingerprint(const std::string& fingerprint) override {
        auto record = records_.find(fingerprint);
        if (!record) {
            return std::nullopt;
        }
        return *record;
    }

    std::optional<domain::SettlementRecord> findByNonce(const std::string& nonce) override {
        for (const auto& record : records_.getAll()) {
            if (record->nonce == nonce) {
                return *record;
            }
        }
        return std::nullopt;
    }

    std::vector<domain::SettlementRecord> findByStatus(domain::SettlementStatus status) override {
        std::vector<domain::SettlementRecord> result;
        for (const auto& record : records_.getAll()) {
            if (record->status == status) {
                result.push_back(*record);
            }
        }
        sortByCreation(result);
        return result;
    }

    std::vector<domain::SettlementRecord> findAll() override {
        std::vector<domain::SettlementRecord> result;
        for (const auto& record : records_.getAll()) {
            result.push_back(*record);
        }
        sortByCreation(result);
        return result;
    }

    bool deleteByFingerprint(const std::string& fingerprint) override {
        return records_.remove(fingerprint);
    }

private:
    static void sortByCreation(std::vector<domain::SettlementRecord>& records) {
        std::sort(records.begin(), records.end(),
                  [](const auto& a, const auto& b) { return a.createdAt < b.createdAt; });
    }

    ThreadSafeMap<std::string, domain::SettlementRecord> records_;
};

} // namespace paygate::adapters::secondary
