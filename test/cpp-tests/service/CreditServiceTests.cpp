/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LedgerException.hpp"
#include "LedgerFixture.hpp"
#include "formatting.hpp"
#include "gemledger/service/CreditService.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <future>

//-------------------------------------------------------------------------

using namespace gemledger;
using namespace gemledger::service;
using namespace std::chrono_literals;
using namespace testing;

//-------------------------------------------------------------------------

struct CreditServiceTest : public Test
{
    static inline const OrganizationId kOrg{"org-1"};

    void SetUp() override
    {
        service.identities().upsertExternalIdentity(kOrg, "alice", "discord", "42");
    }

    CreditOutcome topUp(std::string_view amount, const IdempotencyKey& key)
    {
        return service.creditPurchase(kOrg, "discord", "42", "purchase-" + key, amount, key);
    }

    test::ManualClock time;
    store::MemoryStore memoryStore;
    CreditService service{memoryStore, ServiceConfig{}, time.clock()};
};

//-------------------------------------------------------------------------

TEST_F(CreditServiceTest, CreditsPurchasesInDisplayUnits)
{
    const auto outcome = topUp("5.00", "p-1");
    EXPECT_TRUE(outcome.created);
    EXPECT_EQ(
        outcome.balances,
        (model::Balances{.available = 500, .onHold = 0, .balance = 500}));

    const auto replay = topUp("5.00", "p-1");
    EXPECT_FALSE(replay.created);
    EXPECT_EQ(replay.entryId, outcome.entryId);
    EXPECT_EQ(replay.balances.balance, 500);

    const auto wallet = service.wallets().getWallet(kOrg, outcome.walletId);
    ASSERT_TRUE(wallet.has_value());
    EXPECT_EQ(wallet->userId, "alice");
}

TEST_F(CreditServiceTest, UnlinkedIdentityIsNotFound)
{
    EXPECT_THROW(
        service.creditPurchase(kOrg, "discord", "99", "order", "1.00", "k"), IdentityNotFound);
    EXPECT_THROW(
        service.placeOrderHold(kOrg, "github", "42", "order", "1.00"), IdentityNotFound);
}

TEST_F(CreditServiceTest, RejectsNonPositiveOrMalformedAmounts)
{
    EXPECT_THROW(topUp("0", "k1"), ValidationError);
    EXPECT_THROW(topUp("0.004", "k2"), ValidationError);
    EXPECT_THROW(topUp("-1.00", "k3"), ValidationError);
    EXPECT_THROW(topUp("ten", "k4"), ValidationError);
}

TEST_F(CreditServiceTest, PlacesAndReusesOrderHolds)
{
    topUp("5.00", "p-1");

    const auto placed = service.placeOrderHold(kOrg, "discord", "42", "order-1", "2.00");
    EXPECT_FALSE(placed.reused);
    EXPECT_EQ(placed.expiresAt, time.now + 900s);
    EXPECT_EQ(
        placed.balances,
        (model::Balances{.available = 300, .onHold = 200, .balance = 500}));

    time.advance(10s);
    const auto again = service.placeOrderHold(kOrg, "discord", "42", "order-1", "2.00", 120s);
    EXPECT_TRUE(again.reused);
    EXPECT_EQ(again.holdId, placed.holdId);
    EXPECT_EQ(again.expiresAt, placed.expiresAt);
    EXPECT_EQ(again.balances.onHold, 200);
}

TEST_F(CreditServiceTest, ConcurrentPlacementsOfOneOrderReserveOnce)
{
    topUp("5.00", "p-1");

    std::vector<std::future<HoldPlacement>> racers;
    for (int i = 0; i < 8; ++i) {
        racers.push_back(std::async(std::launch::async, [&] {
            return service.placeOrderHold(kOrg, "discord", "42", "order-1", "2.00");
        }));
    }
    std::vector<HoldPlacement> placements;
    for (auto& racer : racers) {
        placements.push_back(racer.get());
    }

    EXPECT_EQ(
        std::count_if(
            placements.begin(),
            placements.end(),
            [](const auto& placement) { return !placement.reused; }),
        1);
    for (const auto& placement : placements) {
        EXPECT_EQ(placement.holdId, placements.front().holdId);
    }

    const auto walletId = placements.front().walletId;
    EXPECT_EQ(
        service.balances().getBalances(kOrg, walletId),
        (model::Balances{.available = 300, .onHold = 200, .balance = 500}));
}

TEST_F(CreditServiceTest, HoldTtlMustBeWithinConfiguredBounds)
{
    topUp("5.00", "p-1");
    EXPECT_THROW(
        service.placeOrderHold(kOrg, "discord", "42", "order-1", "1.00", 59s), ValidationError);
    EXPECT_THROW(
        service.placeOrderHold(kOrg, "discord", "42", "order-1", "1.00", 3601s), ValidationError);

    const auto placed = service.placeOrderHold(kOrg, "discord", "42", "order-1", "1.00", 60s);
    EXPECT_EQ(placed.expiresAt, time.now + 60s);
}

TEST_F(CreditServiceTest, InsufficientFundsForHold)
{
    topUp("1.00", "p-1");
    EXPECT_THROW(
        service.placeOrderHold(kOrg, "discord", "42", "order-1", "1.01"), InsufficientFunds);
}

TEST_F(CreditServiceTest, RefundReleasesAnActiveHold)
{
    topUp("5.00", "p-1");
    const auto placed = service.placeOrderHold(kOrg, "discord", "42", "order-1", "2.00");

    const auto refund = service.refundOrder(
        kOrg, "discord", "42", "order-1", "2.00", std::nullopt, "refund-1");
    EXPECT_THAT(refund.releasedHoldId, Optional(placed.holdId));
    EXPECT_EQ(refund.entryId, std::nullopt);
    EXPECT_FALSE(refund.created);
    EXPECT_EQ(
        refund.balances,
        (model::Balances{.available = 500, .onHold = 0, .balance = 500}));
    EXPECT_THAT(service.log().history(kOrg, refund.walletId), SizeIs(1));
}

TEST_F(CreditServiceTest, RefundAfterCaptureCreditsBack)
{
    topUp("5.00", "p-1");
    const auto placed = service.placeOrderHold(kOrg, "discord", "42", "order-1", "2.00");
    const auto capture = service.captureOrderHold(kOrg, placed.holdId, "capture-1");
    EXPECT_EQ(capture.balances.balance, 300);

    const auto refund = service.refundOrder(
        kOrg, "discord", "42", "order-1", "2.00", "damaged item", "refund-1");
    EXPECT_EQ(refund.releasedHoldId, std::nullopt);
    EXPECT_TRUE(refund.created);
    EXPECT_EQ(refund.balances.balance, 500);

    const auto replay = service.refundOrder(
        kOrg, "discord", "42", "order-1", "2.00", "damaged item", "refund-1");
    EXPECT_FALSE(replay.created);
    EXPECT_EQ(replay.entryId, refund.entryId);
    EXPECT_EQ(replay.balances.balance, 500);

    const auto entries = service.log().history(kOrg, refund.walletId);
    ASSERT_THAT(entries, SizeIs(3));
    EXPECT_EQ(entries.back().reason, model::EntryReason::REFUND);
    EXPECT_EQ(
        entries.back().reference,
        model::Reference{model::RefundReference{
            .provider = "discord", .orderId = "order-1", .note = "damaged item"}});
}

TEST_F(CreditServiceTest, RefundOfExpiredHoldCredits)
{
    topUp("5.00", "p-1");
    (void) service.placeOrderHold(kOrg, "discord", "42", "order-1", "2.00", 60s);
    time.advance(61s);

    const auto refund = service.refundOrder(
        kOrg, "discord", "42", "order-1", "2.00", std::nullopt, "refund-1");
    EXPECT_EQ(refund.releasedHoldId, std::nullopt);
    EXPECT_TRUE(refund.created);
    EXPECT_EQ(refund.balances.balance, 700);
}

TEST_F(CreditServiceTest, HonoursConfiguredDecimals)
{
    CreditService milli{
        memoryStore,
        ServiceConfig{CurrencyConfig{.decimals = 3}, HoldsConfig{}, StoreConfig{}, AuditConfig{}},
        time.clock()};
    const auto outcome = milli.creditPurchase(kOrg, "discord", "42", "order", "1.2345", "k");
    EXPECT_EQ(outcome.balances.balance, 1235);
    EXPECT_EQ(milli.codec().toDecimalString(outcome.balances.balance), "1.235");
}

//-------------------------------------------------------------------------
