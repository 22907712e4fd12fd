/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/model/ExternalIdentity.hpp"

//-------------------------------------------------------------------------

namespace gemledger::model
{

//-------------------------------------------------------------------------

void ExternalIdentity::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        json::addString(json, "organizationId", organizationId);
        json::addString(json, "userId", userId);
        json::addString(json, "provider", provider);
        json::addString(json, "providerUserId", providerUserId);
        json::setOptionalMember(json, "email", email);
        json::addTimestamp(json, "createdAt", createdAt);
        json::addTimestamp(json, "updatedAt", updatedAt);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

ExternalIdentity ExternalIdentity::fromJson(const rapidjson::Value& json)
{
    return ExternalIdentity{
        .organizationId = json::getString(json, "organizationId"),
        .userId = json::getString(json, "userId"),
        .provider = json::getString(json, "provider"),
        .providerUserId = json::getString(json, "providerUserId"),
        .email = json::getOptionalString(json, "email"),
        .createdAt = json::getTimestamp(json, "createdAt"),
        .updatedAt = json::getTimestamp(json, "updatedAt")
    };
}

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------
