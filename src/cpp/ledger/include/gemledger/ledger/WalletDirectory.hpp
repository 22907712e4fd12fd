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

class WalletDirectory
{
public:
    WalletDirectory(store::Store& store, LedgerSignals& signals, Clock clock = &systemNow);

    // Get-or-create; concurrent first use of the same user yields one wallet.
    [[nodiscard]] model::Wallet ensureWallet(
        const OrganizationId& organizationId, const UserId& userId);

    [[nodiscard]] std::optional<model::Wallet> getWallet(
        const OrganizationId& organizationId, const WalletId& walletId);

    model::Wallet setStatus(
        const OrganizationId& organizationId,
        const WalletId& walletId,
        model::WalletStatus status);

private:
    store::Store& m_store;
    LedgerSignals& m_signals;
    Clock m_clock;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::ledger

//-------------------------------------------------------------------------
