/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LedgerFixture.hpp"
#include "LedgerException.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <set>

//-------------------------------------------------------------------------

using namespace gemledger;
using namespace gemledger::test;
using namespace testing;

//-------------------------------------------------------------------------

struct WalletDirectoryTest : public LedgerFixture
{};

//-------------------------------------------------------------------------

TEST_F(WalletDirectoryTest, CreatesOnFirstUseAndReturnsSameWalletAfterwards)
{
    std::vector<WalletId> created;
    signals.walletCreated.connect([&](const model::Wallet& wallet) { created.push_back(wallet.id); });

    const auto wallet = makeWallet("alice");
    EXPECT_EQ(wallet.organizationId, kOrg);
    EXPECT_EQ(wallet.userId, "alice");
    EXPECT_EQ(wallet.currency, "GEMS");
    EXPECT_EQ(wallet.status, model::WalletStatus::ACTIVE);
    EXPECT_EQ(wallet.createdAt, time.now);

    time.advance(std::chrono::minutes{5});
    EXPECT_EQ(makeWallet("alice"), wallet);
    EXPECT_NE(makeWallet("bob").id, wallet.id);
    EXPECT_NE(wallets.ensureWallet("org-2", "alice").id, wallet.id);

    EXPECT_THAT(created, SizeIs(3));
    EXPECT_EQ(created.front(), wallet.id);
}

TEST_F(WalletDirectoryTest, ConcurrentFirstUseYieldsOneWallet)
{
    std::vector<std::future<model::Wallet>> racers;
    for (int i = 0; i < 8; ++i) {
        racers.push_back(std::async(std::launch::async, [&] { return makeWallet("racer"); }));
    }

    std::set<WalletId> ids;
    for (auto& racer : racers) {
        ids.insert(racer.get().id);
    }
    EXPECT_THAT(ids, SizeIs(1));
}

TEST_F(WalletDirectoryTest, RejectsEmptyIdentifiers)
{
    EXPECT_THROW((void) wallets.ensureWallet("", "alice"), ValidationError);
    EXPECT_THROW((void) wallets.ensureWallet(kOrg, ""), ValidationError);
}

TEST_F(WalletDirectoryTest, LooksUpWithinOrganization)
{
    const auto wallet = makeWallet();
    EXPECT_THAT(wallets.getWallet(kOrg, wallet.id), Optional(wallet));
    EXPECT_EQ(wallets.getWallet("org-2", wallet.id), std::nullopt);
    EXPECT_EQ(wallets.getWallet(kOrg, "missing"), std::nullopt);
}

TEST_F(WalletDirectoryTest, FreezesAndUnfreezes)
{
    std::vector<model::WalletStatus> changes;
    signals.walletStatusChanged.connect(
        [&](const model::Wallet& wallet) { changes.push_back(wallet.status); });

    const auto wallet = makeWallet();
    time.advance(std::chrono::seconds{30});

    const auto frozen = wallets.setStatus(kOrg, wallet.id, model::WalletStatus::FROZEN);
    EXPECT_TRUE(frozen.isFrozen());
    EXPECT_EQ(frozen.updatedAt, time.now);
    EXPECT_THAT(wallets.getWallet(kOrg, wallet.id), Optional(frozen));

    (void) wallets.setStatus(kOrg, wallet.id, model::WalletStatus::FROZEN);
    (void) wallets.setStatus(kOrg, wallet.id, model::WalletStatus::ACTIVE);

    EXPECT_THAT(changes, ElementsAre(model::WalletStatus::FROZEN, model::WalletStatus::ACTIVE));
}

TEST_F(WalletDirectoryTest, StatusOfUnknownWalletIsNotFound)
{
    EXPECT_THROW(
        (void) wallets.setStatus(kOrg, "missing", model::WalletStatus::FROZEN), WalletNotFound);
}

//-------------------------------------------------------------------------
