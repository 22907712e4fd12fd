/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "gemledger/model/Balances.hpp"
#include "gemledger/store/Store.hpp"

//-------------------------------------------------------------------------

namespace gemledger::ledger
{

//-------------------------------------------------------------------------

class BalanceCalculator
{
public:
    explicit BalanceCalculator(store::Store& store, Clock clock = &systemNow);

    // Unknown wallets read as all zeros.
    [[nodiscard]] model::Balances getBalances(
        const OrganizationId& organizationId, const WalletId& walletId);

    [[nodiscard]] static model::Balances compute(
        store::Transaction& txn,
        const OrganizationId& organizationId,
        const WalletId& walletId,
        Timestamp now);

private:
    store::Store& m_store;
    Clock m_clock;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::ledger

//-------------------------------------------------------------------------
