/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "gemledger/store/MemoryStore.hpp"

//-------------------------------------------------------------------------

namespace gemledger::store
{

//-------------------------------------------------------------------------
// Read-only transactions pin a snapshot by holding the table lock shared for
// their whole lifetime. Read-write transactions buffer their writes and
// publish them under the exclusive table lock at commit. Row and unique-key
// locks come from the store's LockManager and are released at the end.

class MemoryTransaction : public Transaction
{
public:
    MemoryTransaction(MemoryStore& store, TransactionMode mode, TxnId id);
    ~MemoryTransaction() noexcept override;

    [[nodiscard]] TransactionMode mode() const noexcept override { return m_mode; }
    [[nodiscard]] bool isOpen() const noexcept override { return m_open; }
    [[nodiscard]] TxnId id() const noexcept { return m_id; }

    [[nodiscard]] std::optional<model::Wallet> findWallet(const model::WalletKey& key) override;
    [[nodiscard]] std::optional<model::Wallet> getWallet(
        const OrganizationId& organizationId, const WalletId& walletId) override;
    [[nodiscard]] std::optional<model::Wallet> lockWallet(
        const OrganizationId& organizationId, const WalletId& walletId) override;
    void insertWallet(const model::Wallet& wallet) override;
    void updateWallet(const model::Wallet& wallet) override;

    [[nodiscard]] std::optional<model::LedgerEntry> findEntryByKey(
        const WalletId& walletId, const IdempotencyKey& idempotencyKey) override;
    void insertEntry(const model::LedgerEntry& entry) override;
    [[nodiscard]] MinorUnits sumEntries(
        const OrganizationId& organizationId,
        const WalletId& walletId,
        model::Direction direction) override;
    [[nodiscard]] std::vector<model::LedgerEntry> listEntries(
        const OrganizationId& organizationId, const WalletId& walletId) override;

    void insertHold(const model::Hold& hold) override;
    [[nodiscard]] std::optional<model::Hold> getHold(
        const OrganizationId& organizationId, const HoldId& holdId) override;
    [[nodiscard]] std::optional<model::Hold> lockHold(
        const OrganizationId& organizationId, const HoldId& holdId) override;
    void updateHold(const model::Hold& hold) override;
    [[nodiscard]] std::optional<model::Hold> findActiveHoldByOrder(
        const OrganizationId& organizationId,
        const WalletId& walletId,
        const std::string& orderId,
        Timestamp now) override;
    [[nodiscard]] MinorUnits sumActiveHolds(
        const OrganizationId& organizationId, const WalletId& walletId, Timestamp now) override;
    [[nodiscard]] std::vector<model::Hold> listOverdueHolds(Timestamp now, size_t limit) override;

    [[nodiscard]] std::optional<model::ExternalIdentity> findIdentity(
        const model::IdentityKey& key) override;
    [[nodiscard]] std::optional<model::ExternalIdentity> lockIdentity(
        const model::IdentityKey& key) override;
    void insertIdentity(const model::ExternalIdentity& identity) override;
    void updateIdentity(const model::ExternalIdentity& identity) override;

    void commit() override;
    void rollback() noexcept override;

private:
    void requireOpen(std::source_location sl = std::source_location::current()) const;
    void requireWritable(std::source_location sl = std::source_location::current()) const;
    void acquire(const std::string& resource);
    void releaseLocks() noexcept;

    [[nodiscard]] std::shared_lock<std::shared_mutex> readLock() const;

    [[nodiscard]] const model::Wallet* walletRow(const WalletId& walletId) const;
    [[nodiscard]] const model::Hold* holdRow(const HoldId& holdId) const;
    [[nodiscard]] const model::ExternalIdentity* identityRow(const model::IdentityKey& key) const;

    MemoryStore& m_store;
    TransactionMode m_mode;
    TxnId m_id;
    bool m_open{true};
    std::shared_lock<std::shared_mutex> m_snapshot;
    std::vector<std::string> m_heldLocks;

    std::map<WalletId, model::Wallet> m_wallets;
    std::vector<model::LedgerEntry> m_entries;
    std::map<HoldId, model::Hold> m_holds;
    std::map<model::IdentityKey, model::ExternalIdentity> m_identities;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::store

//-------------------------------------------------------------------------
