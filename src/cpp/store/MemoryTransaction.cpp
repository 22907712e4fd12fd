/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "MemoryTransaction.hpp"

#include "LedgerException.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace gemledger::store
{

//-------------------------------------------------------------------------

namespace
{

// Length-prefixed so that identifiers containing '/' cannot collide.
std::string lockName(std::string_view table, std::initializer_list<std::string_view> parts)
{
    std::string name{table};
    for (auto part : parts) {
        name += fmt::format("/{}:{}", part.size(), part);
    }
    return name;
}

std::string walletLock(const WalletId& walletId)
{
    return lockName("wallet", {walletId});
}

std::string walletKeyLock(const model::WalletKey& key)
{
    return lockName("wallet-key", {key.organizationId, key.userId, key.currency});
}

std::string entryKeyLock(const WalletId& walletId, const IdempotencyKey& idempotencyKey)
{
    return lockName("entry-key", {walletId, idempotencyKey});
}

std::string holdLock(const HoldId& holdId)
{
    return lockName("hold", {holdId});
}

std::string identityLock(const model::IdentityKey& key)
{
    return lockName("identity", {key.organizationId, key.provider, key.providerUserId});
}

}  // namespace

//-------------------------------------------------------------------------

MemoryTransaction::MemoryTransaction(MemoryStore& store, TransactionMode mode, TxnId id)
    : m_store{store}, m_mode{mode}, m_id{id}
{
    if (m_mode == TransactionMode::READ_ONLY) {
        m_snapshot = std::shared_lock{m_store.m_mtx};
    }
}

//-------------------------------------------------------------------------

MemoryTransaction::~MemoryTransaction() noexcept
{
    if (m_open) {
        rollback();
    }
}

//-------------------------------------------------------------------------

std::optional<model::Wallet> MemoryTransaction::findWallet(const model::WalletKey& key)
{
    requireOpen();
    for (const auto& wallet : m_wallets | views::values) {
        if (wallet.identity() == key) {
            return wallet;
        }
    }
    auto lock = readLock();
    const auto& index = m_store.m_tables.walletsByIdentity;
    if (auto it = index.find(key); it != index.end()) {
        return *walletRow(it->second);
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

std::optional<model::Wallet> MemoryTransaction::getWallet(
    const OrganizationId& organizationId, const WalletId& walletId)
{
    requireOpen();
    auto lock = readLock();
    const auto row = walletRow(walletId);
    if (row == nullptr || row->organizationId != organizationId) {
        return std::nullopt;
    }
    return *row;
}

//-------------------------------------------------------------------------

std::optional<model::Wallet> MemoryTransaction::lockWallet(
    const OrganizationId& organizationId, const WalletId& walletId)
{
    requireWritable();
    acquire(walletLock(walletId));
    return getWallet(organizationId, walletId);
}

//-------------------------------------------------------------------------

void MemoryTransaction::insertWallet(const model::Wallet& wallet)
{
    requireWritable();
    const auto key = wallet.identity();
    acquire(walletKeyLock(key));
    acquire(walletLock(wallet.id));

    if (m_wallets.contains(wallet.id)) {
        throw UniqueViolation{fmt::format("wallet id '{}' already exists", wallet.id)};
    }
    for (const auto& pending : m_wallets | views::values) {
        if (pending.identity() == key) {
            throw UniqueViolation{fmt::format(
                "wallet for user '{}' in organization '{}' already exists",
                key.userId, key.organizationId)};
        }
    }
    {
        auto lock = readLock();
        const auto& tables = m_store.m_tables;
        if (tables.wallets.contains(wallet.id)) {
            throw UniqueViolation{fmt::format("wallet id '{}' already exists", wallet.id)};
        }
        if (tables.walletsByIdentity.contains(key)) {
            throw UniqueViolation{fmt::format(
                "wallet for user '{}' in organization '{}' already exists",
                key.userId, key.organizationId)};
        }
    }
    m_wallets.insert_or_assign(wallet.id, wallet);
}

//-------------------------------------------------------------------------

void MemoryTransaction::updateWallet(const model::Wallet& wallet)
{
    requireWritable();
    acquire(walletLock(wallet.id));
    {
        auto lock = readLock();
        const auto row = walletRow(wallet.id);
        if (row == nullptr) {
            throw std::logic_error{fmt::format(
                "{}: wallet '{}' does not exist", std::source_location::current().function_name(), wallet.id)};
        }
        if (row->identity() != wallet.identity()) {
            throw std::logic_error{fmt::format(
                "{}: identity of wallet '{}' is immutable",
                std::source_location::current().function_name(), wallet.id)};
        }
    }
    m_wallets.insert_or_assign(wallet.id, wallet);
}

//-------------------------------------------------------------------------

std::optional<model::LedgerEntry> MemoryTransaction::findEntryByKey(
    const WalletId& walletId, const IdempotencyKey& idempotencyKey)
{
    requireOpen();
    for (const auto& entry : m_entries) {
        if (entry.walletId == walletId && entry.idempotencyKey == idempotencyKey) {
            return entry;
        }
    }
    auto lock = readLock();
    const auto& tables = m_store.m_tables;
    if (auto it = tables.entriesByKey.find({walletId, idempotencyKey});
        it != tables.entriesByKey.end()) {
        return tables.entriesByWallet.at(walletId).at(it->second);
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

void MemoryTransaction::insertEntry(const model::LedgerEntry& entry)
{
    requireWritable();
    acquire(entryKeyLock(entry.walletId, entry.idempotencyKey));
    const auto duplicate = [&] {
        return UniqueViolation{fmt::format(
            "entry with key '{}' already exists on wallet '{}'",
            entry.idempotencyKey, entry.walletId)};
    };
    for (const auto& pending : m_entries) {
        if (pending.walletId == entry.walletId
            && pending.idempotencyKey == entry.idempotencyKey) {
            throw duplicate();
        }
    }
    {
        auto lock = readLock();
        if (m_store.m_tables.entriesByKey.contains({entry.walletId, entry.idempotencyKey})) {
            throw duplicate();
        }
    }
    m_entries.push_back(entry);
}

//-------------------------------------------------------------------------

MinorUnits MemoryTransaction::sumEntries(
    const OrganizationId& organizationId,
    const WalletId& walletId,
    model::Direction direction)
{
    requireOpen();
    const auto matches = [&](const model::LedgerEntry& entry) {
        return entry.organizationId == organizationId
            && entry.walletId == walletId
            && entry.direction == direction;
    };
    const auto amount = [](const model::LedgerEntry& entry) { return entry.amount; };

    MinorUnits total = ranges::accumulate(
        m_entries | views::filter(matches) | views::transform(amount), MinorUnits{});

    auto lock = readLock();
    const auto& entriesByWallet = m_store.m_tables.entriesByWallet;
    if (auto it = entriesByWallet.find(walletId); it != entriesByWallet.end()) {
        total += ranges::accumulate(
            it->second | views::filter(matches) | views::transform(amount), MinorUnits{});
    }
    return total;
}

//-------------------------------------------------------------------------

std::vector<model::LedgerEntry> MemoryTransaction::listEntries(
    const OrganizationId& organizationId, const WalletId& walletId)
{
    requireOpen();
    const auto matches = [&](const model::LedgerEntry& entry) {
        return entry.organizationId == organizationId && entry.walletId == walletId;
    };

    std::vector<model::LedgerEntry> entries;
    {
        auto lock = readLock();
        const auto& entriesByWallet = m_store.m_tables.entriesByWallet;
        if (auto it = entriesByWallet.find(walletId); it != entriesByWallet.end()) {
            entries = it->second | views::filter(matches) | ranges::to<std::vector>;
        }
    }
    ranges::copy(m_entries | views::filter(matches), ranges::back_inserter(entries));
    return entries;
}

//-------------------------------------------------------------------------

void MemoryTransaction::insertHold(const model::Hold& hold)
{
    requireWritable();
    acquire(holdLock(hold.id));
    const bool exists = [&] {
        if (m_holds.contains(hold.id)) return true;
        auto lock = readLock();
        return m_store.m_tables.holds.contains(hold.id);
    }();
    if (exists) {
        throw UniqueViolation{fmt::format("hold id '{}' already exists", hold.id)};
    }
    m_holds.insert_or_assign(hold.id, hold);
}

//-------------------------------------------------------------------------

std::optional<model::Hold> MemoryTransaction::getHold(
    const OrganizationId& organizationId, const HoldId& holdId)
{
    requireOpen();
    auto lock = readLock();
    const auto row = holdRow(holdId);
    if (row == nullptr || row->organizationId != organizationId) {
        return std::nullopt;
    }
    return *row;
}

//-------------------------------------------------------------------------

std::optional<model::Hold> MemoryTransaction::lockHold(
    const OrganizationId& organizationId, const HoldId& holdId)
{
    requireWritable();
    acquire(holdLock(holdId));
    return getHold(organizationId, holdId);
}

//-------------------------------------------------------------------------

void MemoryTransaction::updateHold(const model::Hold& hold)
{
    requireWritable();
    acquire(holdLock(hold.id));
    {
        auto lock = readLock();
        const auto row = holdRow(hold.id);
        if (row == nullptr) {
            throw std::logic_error{fmt::format(
                "{}: hold '{}' does not exist",
                std::source_location::current().function_name(), hold.id)};
        }
        if (row->organizationId != hold.organizationId
            || row->walletId != hold.walletId
            || row->orderId != hold.orderId) {
            throw std::logic_error{fmt::format(
                "{}: owner of hold '{}' is immutable",
                std::source_location::current().function_name(), hold.id)};
        }
    }
    m_holds.insert_or_assign(hold.id, hold);
}

//-------------------------------------------------------------------------

std::optional<model::Hold> MemoryTransaction::findActiveHoldByOrder(
    const OrganizationId& organizationId,
    const WalletId& walletId,
    const std::string& orderId,
    Timestamp now)
{
    requireOpen();
    auto lock = readLock();

    std::vector<HoldId> candidates;
    const auto [first, last] =
        m_store.m_tables.holdsByOrder.equal_range({organizationId, walletId, orderId});
    for (auto it = first; it != last; ++it) {
        candidates.push_back(it->second);
    }
    for (const auto& hold : m_holds | views::values) {
        if (hold.organizationId == organizationId
            && hold.walletId == walletId
            && hold.orderId == orderId) {
            candidates.push_back(hold.id);
        }
    }

    const model::Hold* found{};
    for (const auto& holdId : candidates) {
        const auto row = holdRow(holdId);
        if (!row->reserves(now)) continue;
        if (found == nullptr || row->createdAt < found->createdAt) {
            found = row;
        }
    }
    if (found == nullptr) {
        return std::nullopt;
    }
    return *found;
}

//-------------------------------------------------------------------------

MinorUnits MemoryTransaction::sumActiveHolds(
    const OrganizationId& organizationId, const WalletId& walletId, Timestamp now)
{
    requireOpen();
    auto lock = readLock();
    const auto& tables = m_store.m_tables;

    MinorUnits total{};
    for (auto it = tables.holdsByOrder.lower_bound({organizationId, walletId, std::string{}});
         it != tables.holdsByOrder.end()
             && std::get<0>(it->first) == organizationId
             && std::get<1>(it->first) == walletId;
         ++it) {
        const auto row = holdRow(it->second);
        if (row->reserves(now)) {
            total += row->amount;
        }
    }
    for (const auto& hold : m_holds | views::values) {
        if (tables.holds.contains(hold.id)) continue;
        if (hold.organizationId == organizationId
            && hold.walletId == walletId
            && hold.reserves(now)) {
            total += hold.amount;
        }
    }
    return total;
}

//-------------------------------------------------------------------------

std::vector<model::Hold> MemoryTransaction::listOverdueHolds(Timestamp now, size_t limit)
{
    requireOpen();
    auto lock = readLock();

    std::vector<model::Hold> overdue;
    for (const auto& holdId : m_store.m_tables.holds | views::keys) {
        if (const auto row = holdRow(holdId); row->isOverdue(now)) {
            overdue.push_back(*row);
        }
    }
    for (const auto& hold : m_holds | views::values) {
        if (!m_store.m_tables.holds.contains(hold.id) && hold.isOverdue(now)) {
            overdue.push_back(hold);
        }
    }
    ranges::sort(overdue, std::less{}, &model::Hold::expiresAt);
    if (overdue.size() > limit) {
        overdue.resize(limit);
    }
    return overdue;
}

//-------------------------------------------------------------------------

std::optional<model::ExternalIdentity> MemoryTransaction::findIdentity(
    const model::IdentityKey& key)
{
    requireOpen();
    auto lock = readLock();
    if (const auto row = identityRow(key)) {
        return *row;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

std::optional<model::ExternalIdentity> MemoryTransaction::lockIdentity(
    const model::IdentityKey& key)
{
    requireWritable();
    acquire(identityLock(key));
    return findIdentity(key);
}

//-------------------------------------------------------------------------

void MemoryTransaction::insertIdentity(const model::ExternalIdentity& identity)
{
    requireWritable();
    const auto key = identity.identity();
    acquire(identityLock(key));
    const bool exists = [&] {
        auto lock = readLock();
        return identityRow(key) != nullptr;
    }();
    if (exists) {
        throw UniqueViolation{fmt::format(
            "identity {}/{} already exists in organization '{}'",
            key.provider, key.providerUserId, key.organizationId)};
    }
    m_identities.insert_or_assign(key, identity);
}

//-------------------------------------------------------------------------

void MemoryTransaction::updateIdentity(const model::ExternalIdentity& identity)
{
    requireWritable();
    const auto key = identity.identity();
    acquire(identityLock(key));
    const bool exists = [&] {
        auto lock = readLock();
        return identityRow(key) != nullptr;
    }();
    if (!exists) {
        throw std::logic_error{fmt::format(
            "{}: identity {}/{} does not exist",
            std::source_location::current().function_name(), key.provider, key.providerUserId)};
    }
    m_identities.insert_or_assign(key, identity);
}

//-------------------------------------------------------------------------

void MemoryTransaction::commit()
{
    requireOpen();
    if (m_mode == TransactionMode::READ_WRITE) {
        std::unique_lock lock{m_store.m_mtx};
        auto& tables = m_store.m_tables;
        for (const auto& wallet : m_wallets | views::values) {
            if (auto it = tables.wallets.find(wallet.id); it != tables.wallets.end()) {
                it->second = wallet;
            } else {
                tables.addWallet(wallet);
            }
        }
        for (const auto& entry : m_entries) {
            tables.addEntry(entry);
        }
        for (const auto& hold : m_holds | views::values) {
            if (auto it = tables.holds.find(hold.id); it != tables.holds.end()) {
                it->second = hold;
            } else {
                tables.addHold(hold);
            }
        }
        for (const auto& [key, identity] : m_identities) {
            tables.identities.insert_or_assign(key, identity);
        }
    }
    rollback();
}

//-------------------------------------------------------------------------

void MemoryTransaction::rollback() noexcept
{
    m_open = false;
    m_wallets.clear();
    m_entries.clear();
    m_holds.clear();
    m_identities.clear();
    releaseLocks();
    if (m_snapshot.owns_lock()) {
        m_snapshot.unlock();
    }
}

//-------------------------------------------------------------------------

void MemoryTransaction::requireOpen(std::source_location sl) const
{
    if (!m_open) {
        throw std::logic_error{fmt::format(
            "{}: transaction #{} is already finished", sl.function_name(), m_id)};
    }
}

//-------------------------------------------------------------------------

void MemoryTransaction::requireWritable(std::source_location sl) const
{
    requireOpen(sl);
    if (m_mode != TransactionMode::READ_WRITE) {
        throw std::logic_error{fmt::format(
            "{}: transaction #{} is read-only", sl.function_name(), m_id)};
    }
}

//-------------------------------------------------------------------------

void MemoryTransaction::acquire(const std::string& resource)
{
    if (!m_store.m_locks.acquire(resource, m_id)) {
        spdlog::warn(
            "Transaction {} gave up waiting for '{}' held by {}",
            m_id,
            resource,
            m_store.m_locks.owner(resource).value_or(0));
        throw TransientStoreError{fmt::format(
            "lock wait timeout on '{}' after {}ms",
            resource,
            m_store.m_locks.timeout().count())};
    }
    if (ranges::find(m_heldLocks, resource) == m_heldLocks.end()) {
        m_heldLocks.push_back(resource);
    }
}

//-------------------------------------------------------------------------

void MemoryTransaction::releaseLocks() noexcept
{
    for (const auto& resource : m_heldLocks) {
        m_store.m_locks.release(resource, m_id);
    }
    m_heldLocks.clear();
}

//-------------------------------------------------------------------------

std::shared_lock<std::shared_mutex> MemoryTransaction::readLock() const
{
    if (m_mode == TransactionMode::READ_ONLY) {
        return {};
    }
    return std::shared_lock{m_store.m_mtx};
}

//-------------------------------------------------------------------------

const model::Wallet* MemoryTransaction::walletRow(const WalletId& walletId) const
{
    if (auto it = m_wallets.find(walletId); it != m_wallets.end()) {
        return &it->second;
    }
    const auto& wallets = m_store.m_tables.wallets;
    if (auto it = wallets.find(walletId); it != wallets.end()) {
        return &it->second;
    }
    return nullptr;
}

//-------------------------------------------------------------------------

const model::Hold* MemoryTransaction::holdRow(const HoldId& holdId) const
{
    if (auto it = m_holds.find(holdId); it != m_holds.end()) {
        return &it->second;
    }
    const auto& holds = m_store.m_tables.holds;
    if (auto it = holds.find(holdId); it != holds.end()) {
        return &it->second;
    }
    return nullptr;
}

//-------------------------------------------------------------------------

const model::ExternalIdentity* MemoryTransaction::identityRow(const model::IdentityKey& key) const
{
    if (auto it = m_identities.find(key); it != m_identities.end()) {
        return &it->second;
    }
    const auto& identities = m_store.m_tables.identities;
    if (auto it = identities.find(key); it != identities.end()) {
        return &it->second;
    }
    return nullptr;
}

//-------------------------------------------------------------------------

}  // namespace gemledger::store

//-------------------------------------------------------------------------
