/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/model/Hold.hpp"

//-------------------------------------------------------------------------

namespace gemledger::model
{

//-------------------------------------------------------------------------

void Hold::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::addString(json, "id", id);
        json::addString(json, "organizationId", organizationId);
        json::addString(json, "walletId", walletId);
        json::addString(json, "provider", provider);
        json::addString(json, "orderId", orderId);
        json.AddMember("amount", rapidjson::Value{static_cast<int64_t>(amount)}, allocator);
        json::addString(json, "status", util::enumName(status));
        json::addTimestamp(json, "expiresAt", expiresAt);
        json::addTimestamp(json, "createdAt", createdAt);
        json::addTimestamp(json, "updatedAt", updatedAt);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Hold Hold::fromJson(const rapidjson::Value& json)
{
    return Hold{
        .id = json::getString(json, "id"),
        .organizationId = json::getString(json, "organizationId"),
        .walletId = json::getString(json, "walletId"),
        .provider = json::getString(json, "provider"),
        .orderId = json::getString(json, "orderId"),
        .amount = json::getInt64(json, "amount"),
        .status = util::parseEnum<HoldStatus>(json::getString(json, "status")),
        .expiresAt = json::getTimestamp(json, "expiresAt"),
        .createdAt = json::getTimestamp(json, "createdAt"),
        .updatedAt = json::getTimestamp(json, "updatedAt")
    };
}

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------
