/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "gemledger/model/ExternalIdentity.hpp"
#include "gemledger/model/Hold.hpp"
#include "gemledger/model/LedgerEntry.hpp"
#include "gemledger/model/Wallet.hpp"

//-------------------------------------------------------------------------

namespace gemledger::store
{

//-------------------------------------------------------------------------

enum class TransactionMode : uint8_t
{
    READ_ONLY,
    READ_WRITE
};

//-------------------------------------------------------------------------
// Raised when an insert collides with a committed row on a unique key.
// Ledger code translates it into "fetch the existing row".

class UniqueViolation : public std::runtime_error
{
public:
    explicit UniqueViolation(const std::string& message) : std::runtime_error{message} {}
};

//-------------------------------------------------------------------------
// One unit of work against the store. Reads see committed rows plus this
// transaction's own writes; writes become visible to others on commit().
// lock*() calls take an exclusive row lock held until commit or rollback.

class Transaction
{
public:
    virtual ~Transaction() noexcept = default;

    [[nodiscard]] virtual TransactionMode mode() const noexcept = 0;
    [[nodiscard]] virtual bool isOpen() const noexcept = 0;

    [[nodiscard]] virtual std::optional<model::Wallet> findWallet(const model::WalletKey& key) = 0;
    [[nodiscard]] virtual std::optional<model::Wallet> getWallet(
        const OrganizationId& organizationId, const WalletId& walletId) = 0;
    [[nodiscard]] virtual std::optional<model::Wallet> lockWallet(
        const OrganizationId& organizationId, const WalletId& walletId) = 0;
    virtual void insertWallet(const model::Wallet& wallet) = 0;
    virtual void updateWallet(const model::Wallet& wallet) = 0;

    // Ledger entries are append-only: there is no update or delete.
    [[nodiscard]] virtual std::optional<model::LedgerEntry> findEntryByKey(
        const WalletId& walletId, const IdempotencyKey& idempotencyKey) = 0;
    virtual void insertEntry(const model::LedgerEntry& entry) = 0;
    [[nodiscard]] virtual MinorUnits sumEntries(
        const OrganizationId& organizationId,
        const WalletId& walletId,
        model::Direction direction) = 0;
    [[nodiscard]] virtual std::vector<model::LedgerEntry> listEntries(
        const OrganizationId& organizationId, const WalletId& walletId) = 0;

    virtual void insertHold(const model::Hold& hold) = 0;
    [[nodiscard]] virtual std::optional<model::Hold> getHold(
        const OrganizationId& organizationId, const HoldId& holdId) = 0;
    [[nodiscard]] virtual std::optional<model::Hold> lockHold(
        const OrganizationId& organizationId, const HoldId& holdId) = 0;
    virtual void updateHold(const model::Hold& hold) = 0;
    [[nodiscard]] virtual std::optional<model::Hold> findActiveHoldByOrder(
        const OrganizationId& organizationId,
        const WalletId& walletId,
        const std::string& orderId,
        Timestamp now) = 0;
    [[nodiscard]] virtual MinorUnits sumActiveHolds(
        const OrganizationId& organizationId, const WalletId& walletId, Timestamp now) = 0;
    [[nodiscard]] virtual std::vector<model::Hold> listOverdueHolds(
        Timestamp now, size_t limit) = 0;

    [[nodiscard]] virtual std::optional<model::ExternalIdentity> findIdentity(
        const model::IdentityKey& key) = 0;
    [[nodiscard]] virtual std::optional<model::ExternalIdentity> lockIdentity(
        const model::IdentityKey& key) = 0;
    virtual void insertIdentity(const model::ExternalIdentity& identity) = 0;
    virtual void updateIdentity(const model::ExternalIdentity& identity) = 0;

    virtual void commit() = 0;
    virtual void rollback() noexcept = 0;

protected:
    Transaction() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::store

//-------------------------------------------------------------------------
