/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LedgerException.hpp"
#include "formatting.hpp"
#include "gemledger/store/MemoryStore.hpp"
#include "gemledger/store/TransactionScope.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>

//-------------------------------------------------------------------------

using namespace gemledger;
using namespace gemledger::store;
using namespace std::chrono_literals;
using namespace testing;

//-------------------------------------------------------------------------

namespace
{

const Timestamp kNow = fromEpochMillis(1'700'000'000'000);

model::Wallet makeWallet(const WalletId& id, const UserId& userId)
{
    return {
        .id = id,
        .organizationId = "org",
        .userId = userId,
        .createdAt = kNow,
        .updatedAt = kNow
    };
}

model::LedgerEntry makeEntry(
    const WalletId& walletId, model::Direction direction, MinorUnits amount, const IdempotencyKey& key)
{
    return {
        .id = "entry-" + walletId + "-" + key,
        .organizationId = "org",
        .walletId = walletId,
        .direction = direction,
        .amount = amount,
        .reason = direction == model::Direction::CREDIT
            ? model::EntryReason::PURCHASE
            : model::EntryReason::MANUAL_ADJUSTMENT,
        .reference = direction == model::Direction::CREDIT
            ? model::Reference{model::PurchaseReference{"stripe", key}}
            : model::Reference{model::AdjustmentReference{"support", key}},
        .idempotencyKey = key,
        .createdAt = kNow
    };
}

model::Hold makeHold(const HoldId& id, const WalletId& walletId, MinorUnits amount, Timestamp expiresAt)
{
    return {
        .id = id,
        .organizationId = "org",
        .walletId = walletId,
        .provider = "shop",
        .orderId = "order-" + id,
        .amount = amount,
        .expiresAt = expiresAt,
        .createdAt = kNow,
        .updatedAt = kNow
    };
}

}  // namespace

//-------------------------------------------------------------------------

struct MemoryStoreTest : public Test
{
    MemoryStore store{MemoryStoreParameters{.lockTimeout = 100ms}};
};

//-------------------------------------------------------------------------

TEST_F(MemoryStoreTest, WritesAreInvisibleUntilCommit)
{
    TransactionScope writer{store, TransactionMode::READ_WRITE};
    writer->insertWallet(makeWallet("w1", "alice"));
    EXPECT_TRUE(writer->getWallet("org", "w1").has_value());

    {
        TransactionScope reader{store, TransactionMode::READ_ONLY};
        EXPECT_EQ(reader->getWallet("org", "w1"), std::nullopt);
    }

    writer.commit();

    TransactionScope reader{store, TransactionMode::READ_ONLY};
    EXPECT_THAT(reader->getWallet("org", "w1"), Optional(Field(&model::Wallet::userId, "alice")));
    EXPECT_EQ(reader->getWallet("other-org", "w1"), std::nullopt);
}

TEST_F(MemoryStoreTest, ScopeRollsBackWhenNotCommitted)
{
    {
        TransactionScope txn{store, TransactionMode::READ_WRITE};
        txn->insertWallet(makeWallet("w1", "alice"));
    }
    TransactionScope reader{store, TransactionMode::READ_ONLY};
    EXPECT_EQ(reader->findWallet({"org", "alice", "GEMS"}), std::nullopt);
    EXPECT_EQ(store.locks().size(), 0u);
}

TEST_F(MemoryStoreTest, WalletIdentityIsUnique)
{
    {
        TransactionScope txn{store, TransactionMode::READ_WRITE};
        txn->insertWallet(makeWallet("w1", "alice"));
        txn.commit();
    }
    TransactionScope txn{store, TransactionMode::READ_WRITE};
    EXPECT_THROW(txn->insertWallet(makeWallet("w2", "alice")), UniqueViolation);
    EXPECT_THROW(txn->insertWallet(makeWallet("w1", "bob")), UniqueViolation);
}

TEST_F(MemoryStoreTest, ConcurrentInsertOfSameKeyWaitsThenConflicts)
{
    MemoryStore slowStore{MemoryStoreParameters{.lockTimeout = 5s}};
    TransactionScope first{slowStore, TransactionMode::READ_WRITE};
    first->insertWallet(makeWallet("w1", "alice"));

    auto second = std::async(std::launch::async, [&] {
        TransactionScope txn{slowStore, TransactionMode::READ_WRITE};
        txn->insertWallet(makeWallet("w2", "alice"));
        txn.commit();
    });
    std::this_thread::sleep_for(20ms);
    first.commit();

    EXPECT_THROW(second.get(), UniqueViolation);
}

TEST_F(MemoryStoreTest, LockWaitTimesOut)
{
    {
        TransactionScope txn{store, TransactionMode::READ_WRITE};
        txn->insertWallet(makeWallet("w1", "alice"));
        txn.commit();
    }
    TransactionScope holder{store, TransactionMode::READ_WRITE};
    ASSERT_TRUE(holder->lockWallet("org", "w1").has_value());

    auto contender = std::async(std::launch::async, [&] {
        TransactionScope txn{store, TransactionMode::READ_WRITE};
        return txn->lockWallet("org", "w1");
    });
    EXPECT_THROW(contender.get(), TransientStoreError);
}

TEST_F(MemoryStoreTest, ReadOnlyTransactionRejectsWrites)
{
    TransactionScope txn{store, TransactionMode::READ_ONLY};
    EXPECT_THROW(txn->insertWallet(makeWallet("w1", "alice")), std::logic_error);
    EXPECT_THROW((void) txn->lockHold("org", "h1"), std::logic_error);
}

TEST_F(MemoryStoreTest, EntryKeyIsUniquePerWallet)
{
    TransactionScope txn{store, TransactionMode::READ_WRITE};
    txn->insertWallet(makeWallet("w1", "alice"));
    txn->insertWallet(makeWallet("w2", "bob"));
    txn->insertEntry(makeEntry("w1", model::Direction::CREDIT, 500, "k1"));
    txn->insertEntry(makeEntry("w2", model::Direction::CREDIT, 500, "k1"));
    EXPECT_THROW(
        txn->insertEntry(makeEntry("w1", model::Direction::CREDIT, 700, "k1")), UniqueViolation);
    txn.commit();

    TransactionScope reader{store, TransactionMode::READ_ONLY};
    EXPECT_THAT(
        reader->findEntryByKey("w1", "k1"),
        Optional(Field(&model::LedgerEntry::amount, 500)));
    EXPECT_EQ(reader->findEntryByKey("w1", "k2"), std::nullopt);
}

TEST_F(MemoryStoreTest, SumsSeePendingAndCommittedRows)
{
    {
        TransactionScope txn{store, TransactionMode::READ_WRITE};
        txn->insertWallet(makeWallet("w1", "alice"));
        txn->insertEntry(makeEntry("w1", model::Direction::CREDIT, 500, "k1"));
        txn.commit();
    }
    TransactionScope txn{store, TransactionMode::READ_WRITE};
    txn->insertEntry(makeEntry("w1", model::Direction::CREDIT, 250, "k2"));
    txn->insertEntry(makeEntry("w1", model::Direction::DEBIT, 100, "k3"));

    EXPECT_EQ(txn->sumEntries("org", "w1", model::Direction::CREDIT), 750);
    EXPECT_EQ(txn->sumEntries("org", "w1", model::Direction::DEBIT), 100);
    EXPECT_EQ(txn->sumEntries("other-org", "w1", model::Direction::CREDIT), 0);
    EXPECT_THAT(
        txn->listEntries("org", "w1"),
        ElementsAre(
            Field(&model::LedgerEntry::idempotencyKey, "k1"),
            Field(&model::LedgerEntry::idempotencyKey, "k2"),
            Field(&model::LedgerEntry::idempotencyKey, "k3")));
}

TEST_F(MemoryStoreTest, ActiveHoldsIgnoreOverdueAndTerminal)
{
    TransactionScope txn{store, TransactionMode::READ_WRITE};
    txn->insertWallet(makeWallet("w1", "alice"));
    txn->insertHold(makeHold("h1", "w1", 100, kNow + 60s));
    txn->insertHold(makeHold("h2", "w1", 200, kNow + 60s));
    txn->insertHold(makeHold("h3", "w1", 400, kNow - 1s));
    txn.commit();

    {
        TransactionScope writer{store, TransactionMode::READ_WRITE};
        auto hold = writer->lockHold("org", "h2");
        ASSERT_TRUE(hold.has_value());
        hold->status = model::HoldStatus::RELEASED;
        writer->updateHold(*hold);
        writer.commit();
    }

    TransactionScope reader{store, TransactionMode::READ_ONLY};
    EXPECT_EQ(reader->sumActiveHolds("org", "w1", kNow), 100);
    EXPECT_THAT(
        reader->findActiveHoldByOrder("org", "w1", "order-h1", kNow),
        Optional(Field(&model::Hold::id, "h1")));
    EXPECT_EQ(reader->findActiveHoldByOrder("org", "w1", "order-h2", kNow), std::nullopt);
    EXPECT_EQ(reader->findActiveHoldByOrder("org", "w1", "order-h3", kNow), std::nullopt);
    EXPECT_THAT(
        reader->listOverdueHolds(kNow, 10),
        ElementsAre(Field(&model::Hold::id, "h3")));
    EXPECT_THAT(reader->listOverdueHolds(kNow + 60s, 10), SizeIs(2));
    EXPECT_THAT(reader->listOverdueHolds(kNow + 60s, 1), SizeIs(1));
}

TEST_F(MemoryStoreTest, HoldOwnerIsImmutable)
{
    TransactionScope txn{store, TransactionMode::READ_WRITE};
    txn->insertWallet(makeWallet("w1", "alice"));
    txn->insertHold(makeHold("h1", "w1", 100, kNow + 60s));
    auto moved = makeHold("h1", "w2", 100, kNow + 60s);
    EXPECT_THROW(txn->updateHold(moved), std::logic_error);
}

TEST_F(MemoryStoreTest, IdentityKeyIsUnique)
{
    const model::ExternalIdentity identity{
        .organizationId = "org",
        .userId = "alice",
        .provider = "discord",
        .providerUserId = "1234",
        .createdAt = kNow,
        .updatedAt = kNow
    };
    TransactionScope txn{store, TransactionMode::READ_WRITE};
    txn->insertIdentity(identity);
    EXPECT_THROW(txn->insertIdentity(identity), UniqueViolation);
    txn.commit();

    TransactionScope reader{store, TransactionMode::READ_ONLY};
    EXPECT_THAT(
        reader->findIdentity(identity.identity()),
        Optional(Field(&model::ExternalIdentity::userId, "alice")));
}

TEST_F(MemoryStoreTest, CheckpointRestoresRowsAndIndexes)
{
    {
        TransactionScope txn{store, TransactionMode::READ_WRITE};
        txn->insertWallet(makeWallet("w1", "alice"));
        txn->insertEntry(makeEntry("w1", model::Direction::CREDIT, 500, "k1"));
        txn->insertEntry(makeEntry("w1", model::Direction::DEBIT, 120, "k2"));
        txn->insertHold(makeHold("h1", "w1", 80, kNow + 60s));
        txn->insertIdentity({
            .organizationId = "org",
            .userId = "alice",
            .provider = "discord",
            .providerUserId = "1234",
            .email = "alice@example.com",
            .createdAt = kNow,
            .updatedAt = kNow
        });
        txn.commit();
    }

    const auto path = fs::temp_directory_path() / "gemledger-memory-store-test.json";
    store.saveCheckpoint(path);
    const auto restored = MemoryStore::fromCheckpoint(path);
    fs::remove(path);

    TransactionScope reader{*restored, TransactionMode::READ_ONLY};
    EXPECT_THAT(
        reader->findWallet({"org", "alice", "GEMS"}),
        Optional(makeWallet("w1", "alice")));
    EXPECT_EQ(reader->sumEntries("org", "w1", model::Direction::CREDIT), 500);
    EXPECT_EQ(reader->sumEntries("org", "w1", model::Direction::DEBIT), 120);
    EXPECT_EQ(reader->sumActiveHolds("org", "w1", kNow), 80);
    EXPECT_THAT(
        reader->findEntryByKey("w1", "k2"),
        Optional(makeEntry("w1", model::Direction::DEBIT, 120, "k2")));
    EXPECT_THAT(
        reader->findIdentity({"org", "discord", "1234"}),
        Optional(Field(&model::ExternalIdentity::email, Optional(std::string{"alice@example.com"}))));
}

TEST_F(MemoryStoreTest, CheckpointWithDanglingRowIsRejected)
{
    const auto json = json::str2json(R"({
        "wallets": [],
        "entries": [{
            "id": "e1", "organizationId": "org", "walletId": "missing",
            "direction": "credit", "amount": 5, "reason": "purchase",
            "reference": {"type": "purchase", "provider": "p", "orderId": "o"},
            "idempotencyKey": "k", "createdAt": 0
        }],
        "holds": [],
        "identities": []
    })");
    EXPECT_THROW((void) MemoryStore::fromJson(json), std::invalid_argument);
}

//-------------------------------------------------------------------------
