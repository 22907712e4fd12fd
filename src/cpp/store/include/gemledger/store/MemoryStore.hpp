/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "CheckpointSerializable.hpp"
#include "gemledger/store/LockManager.hpp"
#include "gemledger/store/Store.hpp"

#include <atomic>
#include <shared_mutex>
#include <tuple>

//-------------------------------------------------------------------------

namespace gemledger::store
{

//-------------------------------------------------------------------------

struct MemoryStoreParameters
{
    std::chrono::milliseconds lockTimeout{5000};
};

//-------------------------------------------------------------------------

struct MemoryTables
{
    using OrderKey = std::tuple<OrganizationId, WalletId, std::string>;

    std::map<WalletId, model::Wallet> wallets;
    std::map<model::WalletKey, WalletId> walletsByIdentity;
    std::map<WalletId, std::vector<model::LedgerEntry>> entriesByWallet;
    std::map<std::pair<WalletId, IdempotencyKey>, size_t> entriesByKey;
    std::map<HoldId, model::Hold> holds;
    std::multimap<OrderKey, HoldId> holdsByOrder;
    std::map<model::IdentityKey, model::ExternalIdentity> identities;

    void addWallet(const model::Wallet& wallet);
    void addEntry(const model::LedgerEntry& entry);
    void addHold(const model::Hold& hold);
};

//-------------------------------------------------------------------------

class MemoryStore : public Store, public CheckpointSerializable
{
public:
    using Parameters = MemoryStoreParameters;

    explicit MemoryStore(Parameters params = {});

    [[nodiscard]] std::unique_ptr<Transaction> begin(TransactionMode mode) override;

    [[nodiscard]] const Parameters& parameters() const noexcept { return m_params; }
    [[nodiscard]] LockManager& locks() noexcept { return m_locks; }

    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    void saveCheckpoint(const fs::path& path) const;

    [[nodiscard]] static std::unique_ptr<MemoryStore> fromJson(
        const rapidjson::Value& json, Parameters params = {});
    [[nodiscard]] static std::unique_ptr<MemoryStore> fromCheckpoint(
        const fs::path& path, Parameters params = {});

private:
    Parameters m_params;
    MemoryTables m_tables;
    mutable std::shared_mutex m_mtx;
    LockManager m_locks;
    std::atomic<TxnId> m_txnCounter{};

    friend class MemoryTransaction;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::store

//-------------------------------------------------------------------------
