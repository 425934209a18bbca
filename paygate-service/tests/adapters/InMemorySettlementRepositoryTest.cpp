#include <gtest/gtest.h>
#include "adapters/secondary/InMemorySettlementRepository.hpp"

using namespace paygate;
using paygate::adapters::secondary::InMemorySettlementRepository;
using domain::SettlementStatus;

class InMemorySettlementRepositoryTest : public ::testing::Test {
protected:
    domain::SettlementRecord createRecord(const std::string& fingerprint,
                                          const std::string& nonce,
                                          SettlementStatus status,
                                          int64_t createdAt) {
        domain::SettlementRecord record;
        record.fingerprint = fingerprint;
        record.nonce = nonce;
        record.status = status;
        record.createdAt = domain::Timestamp::fromUnixSeconds(createdAt);
        record.updatedAt = record.createdAt;
        return record;
    }

    InMemorySettlementRepository repository_;
};

TEST_F(InMemorySettlementRepositoryTest, SaveAndFind) {
    repository_.save(createRecord("fp-1", "n-1", SettlementStatus::PENDING, 100));

    auto found = repository_.findByFingerprint("fp-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->nonce, "n-1");
    EXPECT_FALSE(repository_.findByFingerprint("fp-2").has_value());
}

TEST_F(InMemorySettlementRepositoryTest, SaveOverwrites) {
    repository_.save(createRecord("fp-1", "n-1", SettlementStatus::PENDING, 100));
    repository_.save(createRecord("fp-1", "n-2", SettlementStatus::CONFIRMED, 100));

    EXPECT_EQ(repository_.findAll().size(), 1u);
    EXPECT_EQ(repository_.findByFingerprint("fp-1")->nonce, "n-2");
    EXPECT_FALSE(repository_.findByNonce("n-1").has_value());
}

TEST_F(InMemorySettlementRepositoryTest, FindByStatus_SortedByCreation) {
    repository_.save(createRecord("fp-3", "n-3", SettlementStatus::PENDING, 300));
    repository_.save(createRecord("fp-1", "n-1", SettlementStatus::PENDING, 100));
    repository_.save(createRecord("fp-2", "n-2", SettlementStatus::FAILED, 200));

    auto pending = repository_.findByStatus(SettlementStatus::PENDING);
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].fingerprint, "fp-1");
    EXPECT_EQ(pending[1].fingerprint, "fp-3");

    auto all = repository_.findAll();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[1].fingerprint, "fp-2");
}

TEST_F(InMemorySettlementRepositoryTest, Delete) {
    repository_.save(createRecord("fp-1", "n-1", SettlementStatus::CONFIRMED, 100));

    EXPECT_TRUE(repository_.deleteByFingerprint("fp-1"));
    EXPECT_FALSE(repository_.deleteByFingerprint("fp-1"));
    EXPECT_TRUE(repository_.findAll().empty());
}
