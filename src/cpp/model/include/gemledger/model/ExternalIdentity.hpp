/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "json_util.hpp"

//-------------------------------------------------------------------------

namespace gemledger::model
{

//-------------------------------------------------------------------------

struct IdentityKey
{
    OrganizationId organizationId;
    std::string provider;
    std::string providerUserId;

    auto operator<=>(const IdentityKey&) const = default;
};

//-------------------------------------------------------------------------

struct ExternalIdentity
{
    OrganizationId organizationId;
    UserId userId;
    std::string provider;
    std::string providerUserId;
    std::optional<std::string> email;
    Timestamp createdAt{};
    Timestamp updatedAt{};

    [[nodiscard]] IdentityKey identity() const
    {
        return {organizationId, provider, providerUserId};
    }

    bool operator==(const ExternalIdentity&) const = default;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static ExternalIdentity fromJson(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------
