#include "application/IdempotencyLedger.hpp"
#include "domain/PaymentException.hpp"
#include <iostream>

namespace paygate::application {

IdempotencyLedger::IdempotencyLedger(std::shared_ptr<ports::output::ISettlementRepository> repository,
                                     std::shared_ptr<settings::ILedgerSettings> settings)
    : repository_(std::move(repository))
    , retention_(settings->getRetention())
{
    std::cout << "[IdempotencyLedger] Created, retention=" << retention_.count() << "s" << std::endl;
}

IdempotencyLedger::Lease IdempotencyLedger::acquire(const std::string& fingerprint,
                                                    const domain::Deadline& deadline) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto isFree = [this, &fingerprint]() { return !inFlight_.contains(fingerprint); };

    if (!isFree()) {
        std::cout << "[IdempotencyLedger] " << fingerprint.substr(0, 12)
                  << " in flight, waiting" << std::endl;

        if (deadline.at() == domain::Deadline::Clock::time_point::max()) {
            released_.wait(lock, isFree);
        } else if (!released_.wait_until(lock, deadline.at(), isFree)) {
            throw domain::TransientNetworkException(
                "deadline expired waiting for in-flight call " + fingerprint.substr(0, 12));
        }
    }

    inFlight_.insert(fingerprint);
    return Lease(this, fingerprint);
}

void IdempotencyLedger::release(const std::string& fingerprint) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_.erase(fingerprint);
    }
    released_.notify_all();
}

bool IdempotencyLedger::isLeased(const std::string& fingerprint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_.contains(fingerprint);
}

std::optional<domain::SettlementRecord> IdempotencyLedger::get(const std::string& fingerprint) const {
    return repository_->findByFingerprint(fingerprint);
}

void IdempotencyLedger::put(const std::string& fingerprint, const domain::SettlementRecord& record) {
    domain::SettlementRecord stored = record;
    stored.fingerprint = fingerprint;
    repository_->save(stored);
    std::cout << "[IdempotencyLedger] " << fingerprint.substr(0, 12) << " nonce=" << stored.nonce
              << " -> " << domain::toString(stored.status) << std::endl;
}

std::optional<domain::SettlementRecord> IdempotencyLedger::findByNonce(const std::string& nonce) const {
    return repository_->findByNonce(nonce);
}

std::vector<domain::SettlementRecord> IdempotencyLedger::list(
    const std::optional<domain::SettlementStatus>& status) const {
    if (status) {
        return repository_->findByStatus(*status);
    }
    return repository_->findAll();
}

size_t IdempotencyLedger::evictExpired(const domain::Timestamp& now) {
    // Под мьютексом: новая аренда не начнётся между проверкой и удалением
    std::lock_guard<std::mutex> lock(mutex_);

    size_t evicted = 0;
    for (const auto& record : repository_->findAll()) {
        if (!domain::isTerminal(record.status)) {
            continue;
        }
        if (inFlight_.contains(record.fingerprint)) {
            continue;
        }
        if (record.updatedAt.plusSeconds(retention_.count()) > now) {
            continue;
        }
        if (repository_->deleteByFingerprint(record.fingerprint)) {
            ++evicted;
        }
    }

    if (evicted > 0) {
        std::cout << "[IdempotencyLedger] Evicted " << evicted << " expired records" << std::endl;
    }
    return evicted;
}

} // namespace paygate::application
