/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/ledger/BalanceCalculator.hpp"

#include "gemledger/store/TransactionScope.hpp"

//-------------------------------------------------------------------------

namespace gemledger::ledger
{

//-------------------------------------------------------------------------

BalanceCalculator::BalanceCalculator(store::Store& store, Clock clock)
    : m_store{store}, m_clock{std::move(clock)}
{}

//-------------------------------------------------------------------------

model::Balances BalanceCalculator::getBalances(
    const OrganizationId& organizationId, const WalletId& walletId)
{
    util::requireNonEmpty(organizationId, "organizationId");
    util::requireNonEmpty(walletId, "walletId");

    const auto now = m_clock();
    store::TransactionScope txn{m_store, store::TransactionMode::READ_ONLY};
    return compute(*txn, organizationId, walletId, now);
}

//-------------------------------------------------------------------------

model::Balances BalanceCalculator::compute(
    store::Transaction& txn,
    const OrganizationId& organizationId,
    const WalletId& walletId,
    Timestamp now)
{
    const MinorUnits credited = txn.sumEntries(organizationId, walletId, model::Direction::CREDIT);
    const MinorUnits debited = txn.sumEntries(organizationId, walletId, model::Direction::DEBIT);
    const MinorUnits held = txn.sumActiveHolds(organizationId, walletId, now);
    return model::Balances::fromAggregates(credited, debited, held);
}

//-------------------------------------------------------------------------

}  // namespace gemledger::ledger

//-------------------------------------------------------------------------
