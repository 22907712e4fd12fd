/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "formatting.hpp"
#include "gemledger/ledger/BalanceCalculator.hpp"
#include "gemledger/ledger/HoldEngine.hpp"
#include "gemledger/ledger/IdentityResolver.hpp"
#include "gemledger/ledger/LedgerLog.hpp"
#include "gemledger/ledger/WalletDirectory.hpp"
#include "gemledger/store/MemoryStore.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

namespace gemledger::test
{

//-------------------------------------------------------------------------

struct ManualClock
{
    Timestamp now{fromEpochMillis(1'700'000'000'000)};

    [[nodiscard]] Clock clock() { return [this] { return now; }; }

    void advance(std::chrono::milliseconds delta) { now += delta; }
};

//-------------------------------------------------------------------------

struct LedgerFixture : public testing::Test
{
    static inline const OrganizationId kOrg{"org-1"};

    model::Wallet makeWallet(const UserId& userId = "user-1")
    {
        return wallets.ensureWallet(kOrg, userId);
    }

    ledger::EntryInsertion credit(
        const WalletId& walletId, MinorUnits amount, const IdempotencyKey& key)
    {
        return log.insertLedgerEntry(
            kOrg,
            walletId,
            model::Direction::CREDIT,
            amount,
            model::EntryReason::PURCHASE,
            model::PurchaseReference{.provider = "stripe", .orderId = "purchase-" + key},
            key);
    }

    ledger::EntryInsertion debit(
        const WalletId& walletId, MinorUnits amount, const IdempotencyKey& key)
    {
        return log.insertLedgerEntry(
            kOrg,
            walletId,
            model::Direction::DEBIT,
            amount,
            model::EntryReason::MANUAL_ADJUSTMENT,
            model::AdjustmentReference{.actor = "support", .note = "correction"},
            key);
    }

    ManualClock time;
    store::MemoryStore memoryStore{store::MemoryStoreParameters{
        .lockTimeout = std::chrono::milliseconds{2000}}};
    ledger::LedgerSignals signals;
    ledger::WalletDirectory wallets{memoryStore, signals, time.clock()};
    ledger::LedgerLog log{memoryStore, signals, time.clock()};
    ledger::BalanceCalculator balances{memoryStore, time.clock()};
    ledger::HoldEngine holds{memoryStore, log, signals, time.clock()};
    ledger::IdentityResolver identities{memoryStore, time.clock()};
};

//-------------------------------------------------------------------------

}  // namespace gemledger::test

//-------------------------------------------------------------------------
