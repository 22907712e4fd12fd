/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/model/LedgerEntry.hpp"

//-------------------------------------------------------------------------

namespace gemledger::model
{

//-------------------------------------------------------------------------

void LedgerEntry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::addString(json, "id", id);
        json::addString(json, "organizationId", organizationId);
        json::addString(json, "walletId", walletId);
        json::addString(json, "direction", util::enumName(direction));
        json.AddMember("amount", rapidjson::Value{static_cast<int64_t>(amount)}, allocator);
        json::addString(json, "reason", util::enumName(reason));
        serializeReference(json, reference, "reference");
        json::addString(json, "idempotencyKey", idempotencyKey);
        json::addTimestamp(json, "createdAt", createdAt);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

LedgerEntry LedgerEntry::fromJson(const rapidjson::Value& json)
{
    return LedgerEntry{
        .id = json::getString(json, "id"),
        .organizationId = json::getString(json, "organizationId"),
        .walletId = json::getString(json, "walletId"),
        .direction = util::parseEnum<Direction>(json::getString(json, "direction")),
        .amount = json::getInt64(json, "amount"),
        .reason = util::parseEnum<EntryReason>(json::getString(json, "reason")),
        .reference = referenceFromJson(json["reference"]),
        .idempotencyKey = json::getString(json, "idempotencyKey"),
        .createdAt = json::getTimestamp(json, "createdAt")
    };
}

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------
