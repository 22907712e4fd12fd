/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/ledger/WalletDirectory.hpp"

#include "gemledger/store/TransactionScope.hpp"

//-------------------------------------------------------------------------

namespace gemledger::ledger
{

//-------------------------------------------------------------------------

using store::TransactionMode;
using store::TransactionScope;

//-------------------------------------------------------------------------

WalletDirectory::WalletDirectory(store::Store& store, LedgerSignals& signals, Clock clock)
    : m_store{store}, m_signals{signals}, m_clock{std::move(clock)}
{}

//-------------------------------------------------------------------------

model::Wallet WalletDirectory::ensureWallet(
    const OrganizationId& organizationId, const UserId& userId)
{
    util::requireNonEmpty(organizationId, "organizationId");
    util::requireNonEmpty(userId, "userId");

    const model::WalletKey key{organizationId, userId, std::string{kCurrencyCode}};
    {
        TransactionScope txn{m_store, TransactionMode::READ_ONLY};
        if (auto wallet = txn->findWallet(key)) {
            return *wallet;
        }
    }

    const auto now = m_clock();
    const model::Wallet wallet{
        .id = util::generateId(),
        .organizationId = organizationId,
        .userId = userId,
        .currency = key.currency,
        .status = model::WalletStatus::ACTIVE,
        .createdAt = now,
        .updatedAt = now
    };

    try {
        TransactionScope txn{m_store, TransactionMode::READ_WRITE};
        txn->insertWallet(wallet);
        txn.commit();
    }
    catch (const store::UniqueViolation&) {
        TransactionScope txn{m_store, TransactionMode::READ_ONLY};
        if (auto existing = txn->findWallet(key)) {
            return *existing;
        }
        throw TransientStoreError{fmt::format(
            "{}: wallet for user '{}' vanished after a unique conflict",
            std::source_location::current().function_name(),
            userId)};
    }

    m_signals.walletCreated(wallet);
    return wallet;
}

//-------------------------------------------------------------------------

std::optional<model::Wallet> WalletDirectory::getWallet(
    const OrganizationId& organizationId, const WalletId& walletId)
{
    TransactionScope txn{m_store, TransactionMode::READ_ONLY};
    return txn->getWallet(organizationId, walletId);
}

//-------------------------------------------------------------------------

model::Wallet WalletDirectory::setStatus(
    const OrganizationId& organizationId,
    const WalletId& walletId,
    model::WalletStatus status)
{
    util::requireNonEmpty(organizationId, "organizationId");
    util::requireNonEmpty(walletId, "walletId");
    util::validateEnum(status);

    TransactionScope txn{m_store, TransactionMode::READ_WRITE};
    auto wallet = txn->lockWallet(organizationId, walletId);
    if (!wallet) {
        throw WalletNotFound{fmt::format(
            "{}: no wallet '{}' in organization '{}'",
            std::source_location::current().function_name(),
            walletId,
            organizationId)};
    }
    if (wallet->status == status) {
        return *wallet;
    }
    wallet->status = status;
    wallet->updatedAt = m_clock();
    txn->updateWallet(*wallet);
    txn.commit();

    m_signals.walletStatusChanged(*wallet);
    return *wallet;
}

//-------------------------------------------------------------------------

}  // namespace gemledger::ledger

//-------------------------------------------------------------------------
