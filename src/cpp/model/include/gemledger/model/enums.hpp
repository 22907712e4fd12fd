/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "util.hpp"

//-------------------------------------------------------------------------

namespace gemledger::model
{

//-------------------------------------------------------------------------

enum class WalletStatus : uint8_t
{
    ACTIVE,
    FROZEN
};

enum class Direction : uint8_t
{
    CREDIT,
    DEBIT
};

enum class EntryReason : uint8_t
{
    PURCHASE,
    CAPTURE,
    MANUAL_ADJUSTMENT,
    REFUND
};

enum class HoldStatus : uint8_t
{
    ACTIVE,
    CAPTURED,
    RELEASED,
    EXPIRED
};

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------

template<typename E>
requires (
    std::same_as<E, gemledger::model::WalletStatus>
    || std::same_as<E, gemledger::model::Direction>
    || std::same_as<E, gemledger::model::EntryReason>
    || std::same_as<E, gemledger::model::HoldStatus>)
struct fmt::formatter<E>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(E value, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", gemledger::util::enumName(value));
    }
};

//-------------------------------------------------------------------------
