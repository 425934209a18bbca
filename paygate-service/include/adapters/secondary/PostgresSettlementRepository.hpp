#pragma once

#include "application/PaymentCodec.hpp"
#include "ports/output/ISettlementRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace paygate::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища леджера
 *
 * Таблица settlement_records, upsert по fingerprint.
 * Авторизация хранится JSON-ом в формате X-PAYMENT (без base64).
 * Время: unix-секунды.
 */
class PostgresSettlementRepository : public ports::output::ISettlementRepository {
public:
    explicit PostgresSettlementRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresSettlementRepo] Connecting to " << settings_->getHost() << ":"
                  << settings_->getPort() << "/" << settings_->getName() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            ensureSchema();
            std::cout << "[PostgresSettlementRepo] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettlementRepo] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresSettlementRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void save(const domain::SettlementRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params(
                R"(
                    INSERT INTO settlement_records (
                        fingerprint, nonce, status, authorization_json, created_at, updated_at
                    )
                    VALUES ($1, $2, $3, $4, $5, $6)
                    ON CONFLICT (fingerprint) DO UPDATE SET
                        nonce = EXCLUDED.nonce,
                        status = EXCLUDED.status,
                        authorization_json = EXCLUDED.authorization_json,
                        created_at = EXCLUDED.created_at,
                        updated_at = EXCLUDED.updated_at
                )",
                record.fingerprint,
                record.nonce,
                domain::toString(record.status),
                application::PaymentCodec::toJson(record.authorization).dump(),
                record.createdAt.toUnixSeconds(),
                record.updatedAt.toUnixSeconds()
            );
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettlementRepo] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::SettlementRecord> findByFingerprint(const std::string& fingerprint) override {
        auto rows = query(SELECT_COLUMNS + " WHERE fingerprint = $1", fingerprint);
        if (rows.empty()) {
            return std::nullopt;
        }
        return rows.front();
    }

    std::optional<domain::SettlementRecord> findByNonce(const std::string& nonce) override {
        auto rows = query(SELECT_COLUMNS + " WHERE nonce = $1 ORDER BY updated_at DESC LIMIT 1", nonce);
        if (rows.empty()) {
            return std::nullopt;
        }
        return rows.front();
    }

    std::vector<domain::SettlementRecord> findByStatus(domain::SettlementStatus status) override {
        return query(SELECT_COLUMNS + " WHERE status = $1 ORDER BY created_at", domain::toString(status));
    }

    std::vector<domain::SettlementRecord> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::work txn(*connection_);
        auto result = txn.exec(SELECT_COLUMNS + " ORDER BY created_at");
        txn.commit();
        return mapRows(result);
    }

    bool deleteByFingerprint(const std::string& fingerprint) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pqxx::work txn(*connection_);
        auto result = txn.exec_params("DELETE FROM settlement_records WHERE fingerprint = $1", fingerprint);
        txn.commit();
        return result.affected_rows() > 0;
    }

private:
    inline static const std::string SELECT_COLUMNS =
        "SELECT fingerprint, nonce, status, authorization_json, created_at, updated_at FROM settlement_records";

    void ensureSchema() {
        pqxx::work txn(*connection_);
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS settlement_records (
                fingerprint        VARCHAR(64) PRIMARY KEY,
                nonce              TEXT NOT NULL,
                status             VARCHAR(16) NOT NULL,
                authorization_json TEXT NOT NULL,
                created_at         BIGINT NOT NULL,
                updated_at         BIGINT NOT NULL
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_settlement_records_nonce ON settlement_records (nonce)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_settlement_records_status ON settlement_records (status)");
        txn.commit();
    }

    std::vector<domain::SettlementRecord> query(const std::string& sql, const std::string& param) {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(sql, param);
            txn.commit();
            return mapRows(result);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettlementRepo] query failed: " << e.what() << std::endl;
            throw;
        }
    }

    static std::vector<domain::SettlementRecord> mapRows(const pqxx::result& result) {
        std::vector<domain::SettlementRecord> records;
        records.reserve(result.size());
        for (const auto& row : result) {
            domain::SettlementRecord record;
            record.fingerprint = row[0].as<std::string>();
            record.nonce = row[1].as<std::string>();
            record.status = domain::parseSettlementStatus(row[2].as<std::string>());
            record.authorization = application::PaymentCodec::fromJson(
                nlohmann::json::parse(row[3].as<std::string>()));
            record.createdAt = domain::Timestamp::fromUnixSeconds(row[4].as<int64_t>());
            record.updatedAt = domain::Timestamp::fromUnixSeconds(row[5].as<int64_t>());
            records.push_back(std::move(record));
        }
        return records;
    }

    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;
};

} // namespace paygate::adapters::secondary
