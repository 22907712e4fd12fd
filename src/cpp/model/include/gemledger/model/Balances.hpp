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
// balance = available + onHold, always.

struct Balances
{
    MinorUnits available{};
    MinorUnits onHold{};
    MinorUnits balance{};

    bool operator==(const Balances&) const = default;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static Balances fromAggregates(
        MinorUnits credited, MinorUnits debited, MinorUnits held);
};

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<gemledger::model::Balances>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const gemledger::model::Balances& bal, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{} ({} | {})", bal.balance, bal.available, bal.onHold);
    }
};

//-------------------------------------------------------------------------
