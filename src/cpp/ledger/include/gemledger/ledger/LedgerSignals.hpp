/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "gemledger/model/Hold.hpp"
#include "gemledger/model/LedgerEntry.hpp"
#include "gemledger/model/Wallet.hpp"

//-------------------------------------------------------------------------

namespace gemledger::ledger
{

//-------------------------------------------------------------------------
// Fired after the owning transaction has committed.

struct LedgerSignals
{
    SyncSignal<void(const model::Wallet&)> walletCreated;
    SyncSignal<void(const model::Wallet&)> walletStatusChanged;
    SyncSignal<void(const model::LedgerEntry&)> entryAppended;
    SyncSignal<void(const model::Hold&)> holdTransitioned;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::ledger

//-------------------------------------------------------------------------
