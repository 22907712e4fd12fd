/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "gemledger/model/enums.hpp"
#include "json_util.hpp"

//-------------------------------------------------------------------------

namespace gemledger::model
{

//-------------------------------------------------------------------------

struct WalletKey
{
    OrganizationId organizationId;
    UserId userId;
    std::string currency;

    auto operator<=>(const WalletKey&) const = default;
};

//-------------------------------------------------------------------------

struct Wallet
{
    WalletId id;
    OrganizationId organizationId;
    UserId userId;
    std::string currency{kCurrencyCode};
    WalletStatus status{WalletStatus::ACTIVE};
    Timestamp createdAt{};
    Timestamp updatedAt{};

    [[nodiscard]] WalletKey identity() const { return {organizationId, userId, currency}; }
    [[nodiscard]] bool isFrozen() const noexcept { return status == WalletStatus::FROZEN; }

    bool operator==(const Wallet&) const = default;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static Wallet fromJson(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------
