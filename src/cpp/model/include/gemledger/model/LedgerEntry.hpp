/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "gemledger/model/Reference.hpp"
#include "gemledger/model/enums.hpp"
#include "json_util.hpp"

//-------------------------------------------------------------------------

namespace gemledger::model
{

//-------------------------------------------------------------------------

struct LedgerEntry
{
    EntryId id;
    OrganizationId organizationId;
    WalletId walletId;
    Direction direction{Direction::CREDIT};
    MinorUnits amount{};
    EntryReason reason{EntryReason::PURCHASE};
    Reference reference;
    IdempotencyKey idempotencyKey;
    Timestamp createdAt{};

    [[nodiscard]] MinorUnits signedAmount() const noexcept
    {
        return direction == Direction::CREDIT ? amount : -amount;
    }

    bool operator==(const LedgerEntry&) const = default;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static LedgerEntry fromJson(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<gemledger::model::LedgerEntry>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const gemledger::model::LedgerEntry& entry, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{} {} {} ({}) key={}",
            entry.id,
            entry.direction,
            entry.amount,
            entry.reason,
            entry.idempotencyKey);
    }
};

//-------------------------------------------------------------------------
