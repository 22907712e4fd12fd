/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "gemledger/ledger/LedgerSignals.hpp"
#include "gemledger/store/Store.hpp"

//-------------------------------------------------------------------------

namespace gemledger::ledger
{

//-------------------------------------------------------------------------

struct EntryInsertion
{
    EntryId id;
    bool created{};
};

struct AppendResult
{
    model::LedgerEntry entry;
    bool created{};
};

//-------------------------------------------------------------------------

class LedgerLog
{
public:
    LedgerLog(store::Store& store, LedgerSignals& signals, Clock clock = &systemNow);

    // Replaying an idempotency key already stored on the wallet returns the
    // stored entry's id and records nothing.
    EntryInsertion insertLedgerEntry(
        const OrganizationId& organizationId,
        const WalletId& walletId,
        model::Direction direction,
        MinorUnits amount,
        model::EntryReason reason,
        const model::Reference& reference,
        const IdempotencyKey& idempotencyKey);

    [[nodiscard]] std::vector<model::LedgerEntry> history(
        const OrganizationId& organizationId, const WalletId& walletId);

    // Appends a validated draft inside the caller's transaction. The draft's
    // id and createdAt are assigned here. Signals are left to the caller,
    // since only it knows when the transaction commits.
    [[nodiscard]] AppendResult append(
        store::Transaction& txn, model::LedgerEntry draft, Timestamp now);

    static void validate(const model::LedgerEntry& draft);

private:
    store::Store& m_store;
    LedgerSignals& m_signals;
    Clock m_clock;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::ledger

//-------------------------------------------------------------------------
