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

struct Hold
{
    HoldId id;
    OrganizationId organizationId;
    WalletId walletId;
    std::string provider;
    std::string orderId;
    MinorUnits amount{};
    HoldStatus status{HoldStatus::ACTIVE};
    Timestamp expiresAt{};
    Timestamp createdAt{};
    Timestamp updatedAt{};

    [[nodiscard]] bool isTerminal() const noexcept { return status != HoldStatus::ACTIVE; }

    // Still active on paper, but past its expiry.
    [[nodiscard]] bool isOverdue(Timestamp now) const noexcept
    {
        return status == HoldStatus::ACTIVE && expiresAt <= now;
    }

    [[nodiscard]] bool reserves(Timestamp now) const noexcept
    {
        return status == HoldStatus::ACTIVE && now < expiresAt;
    }

    bool operator==(const Hold&) const = default;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static Hold fromJson(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<gemledger::model::Hold>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const gemledger::model::Hold& hold, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "hold {} [{}] {} for {}/{}",
            hold.id,
            hold.status,
            hold.amount,
            hold.provider,
            hold.orderId);
    }
};

//-------------------------------------------------------------------------
