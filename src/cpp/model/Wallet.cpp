/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/model/Wallet.hpp"

//-------------------------------------------------------------------------

namespace gemledger::model
{

//-------------------------------------------------------------------------

void Wallet::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        json::addString(json, "id", id);
        json::addString(json, "organizationId", organizationId);
        json::addString(json, "userId", userId);
        json::addString(json, "currency", currency);
        json::addString(json, "status", util::enumName(status));
        json::addTimestamp(json, "createdAt", createdAt);
        json::addTimestamp(json, "updatedAt", updatedAt);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Wallet Wallet::fromJson(const rapidjson::Value& json)
{
    return Wallet{
        .id = json::getString(json, "id"),
        .organizationId = json::getString(json, "organizationId"),
        .userId = json::getString(json, "userId"),
        .currency = json::getString(json, "currency"),
        .status = util::parseEnum<WalletStatus>(json::getString(json, "status")),
        .createdAt = json::getTimestamp(json, "createdAt"),
        .updatedAt = json::getTimestamp(json, "updatedAt")
    };
}

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------
