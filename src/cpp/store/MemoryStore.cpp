/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/store/MemoryStore.hpp"

#include "MemoryTransaction.hpp"
#include "Recoverable.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace gemledger::store
{

//-------------------------------------------------------------------------

static_assert(serialization::Recoverable<MemoryStore>);

//-------------------------------------------------------------------------

void MemoryTables::addWallet(const model::Wallet& wallet)
{
    if (!wallets.emplace(wallet.id, wallet).second) {
        throw std::invalid_argument{fmt::format("duplicate wallet id '{}'", wallet.id)};
    }
    if (!walletsByIdentity.emplace(wallet.identity(), wallet.id).second) {
        wallets.erase(wallet.id);
        throw std::invalid_argument{fmt::format(
            "duplicate wallet for user '{}' in organization '{}'",
            wallet.userId, wallet.organizationId)};
    }
}

//-------------------------------------------------------------------------

void MemoryTables::addEntry(const model::LedgerEntry& entry)
{
    auto& entries = entriesByWallet[entry.walletId];
    if (!entriesByKey.emplace(std::pair{entry.walletId, entry.idempotencyKey}, entries.size()).second) {
        throw std::invalid_argument{fmt::format(
            "duplicate entry key '{}' on wallet '{}'", entry.idempotencyKey, entry.walletId)};
    }
    entries.push_back(entry);
}

//-------------------------------------------------------------------------

void MemoryTables::addHold(const model::Hold& hold)
{
    if (!holds.emplace(hold.id, hold).second) {
        throw std::invalid_argument{fmt::format("duplicate hold id '{}'", hold.id)};
    }
    holdsByOrder.emplace(OrderKey{hold.organizationId, hold.walletId, hold.orderId}, hold.id);
}

//-------------------------------------------------------------------------

MemoryStore::MemoryStore(Parameters params)
    : m_params{params}, m_locks{params.lockTimeout}
{
    if (m_params.lockTimeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument{fmt::format(
            "{}: lock timeout should be positive, was {}ms",
            std::source_location::current().function_name(),
            m_params.lockTimeout.count())};
    }
}

//-------------------------------------------------------------------------

std::unique_ptr<Transaction> MemoryStore::begin(TransactionMode mode)
{
    return std::make_unique<MemoryTransaction>(*this, mode, ++m_txnCounter);
}

//-------------------------------------------------------------------------

void MemoryStore::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();

        std::shared_lock lock{m_mtx};

        rapidjson::Value walletsJson{rapidjson::kArrayType};
        for (const auto& wallet : m_tables.wallets | views::values) {
            rapidjson::Document walletJson{&allocator};
            wallet.jsonSerialize(walletJson);
            walletsJson.PushBack(walletJson, allocator);
        }
        json.AddMember("wallets", walletsJson, allocator);

        rapidjson::Value entriesJson{rapidjson::kArrayType};
        for (const auto& entry : m_tables.entriesByWallet | views::values | views::join) {
            rapidjson::Document entryJson{&allocator};
            entry.jsonSerialize(entryJson);
            entriesJson.PushBack(entryJson, allocator);
        }
        json.AddMember("entries", entriesJson, allocator);

        rapidjson::Value holdsJson{rapidjson::kArrayType};
        for (const auto& hold : m_tables.holds | views::values) {
            rapidjson::Document holdJson{&allocator};
            hold.jsonSerialize(holdJson);
            holdsJson.PushBack(holdJson, allocator);
        }
        json.AddMember("holds", holdsJson, allocator);

        rapidjson::Value identitiesJson{rapidjson::kArrayType};
        for (const auto& identity : m_tables.identities | views::values) {
            rapidjson::Document identityJson{&allocator};
            identity.jsonSerialize(identityJson);
            identitiesJson.PushBack(identityJson, allocator);
        }
        json.AddMember("identities", identitiesJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void MemoryStore::saveCheckpoint(const fs::path& path) const
{
    rapidjson::Document json;
    checkpointSerialize(json);

    auto tmpPath = path;
    tmpPath += ".tmp";
    {
        std::ofstream ofs{tmpPath};
        if (!ofs) {
            throw std::runtime_error{fmt::format(
                "{}: could not open '{}' for writing",
                std::source_location::current().function_name(),
                tmpPath.c_str())};
        }
        json::dumpJson(json, ofs, {.indent = json::IndentOptions{}});
    }
    fs::rename(tmpPath, path);
    spdlog::info("Checkpoint written to {}", path.c_str());
}

//-------------------------------------------------------------------------

std::unique_ptr<MemoryStore> MemoryStore::fromJson(const rapidjson::Value& json, Parameters params)
{
    auto store = std::make_unique<MemoryStore>(params);
    auto& tables = store->m_tables;

    for (const auto& walletJson : json["wallets"].GetArray()) {
        tables.addWallet(model::Wallet::fromJson(walletJson));
    }
    for (const auto& entryJson : json["entries"].GetArray()) {
        auto entry = model::LedgerEntry::fromJson(entryJson);
        if (!tables.wallets.contains(entry.walletId)) {
            throw std::invalid_argument{fmt::format(
                "entry '{}' refers to unknown wallet '{}'", entry.id, entry.walletId)};
        }
        tables.addEntry(entry);
    }
    for (const auto& holdJson : json["holds"].GetArray()) {
        auto hold = model::Hold::fromJson(holdJson);
        if (!tables.wallets.contains(hold.walletId)) {
            throw std::invalid_argument{fmt::format(
                "hold '{}' refers to unknown wallet '{}'", hold.id, hold.walletId)};
        }
        tables.addHold(hold);
    }
    for (const auto& identityJson : json["identities"].GetArray()) {
        auto identity = model::ExternalIdentity::fromJson(identityJson);
        auto key = identity.identity();
        if (!tables.identities.emplace(key, std::move(identity)).second) {
            throw std::invalid_argument{fmt::format(
                "duplicate identity {}/{} in organization '{}'",
                key.provider, key.providerUserId, key.organizationId)};
        }
    }
    return store;
}

//-------------------------------------------------------------------------

std::unique_ptr<MemoryStore> MemoryStore::fromCheckpoint(const fs::path& path, Parameters params)
{
    const auto json = json::loadJson(path);
    auto store = fromJson(json, params);
    spdlog::info(
        "Recovered {} wallets and {} holds from {}",
        store->m_tables.wallets.size(),
        store->m_tables.holds.size(),
        path.c_str());
    return store;
}

//-------------------------------------------------------------------------

}  // namespace gemledger::store

//-------------------------------------------------------------------------
