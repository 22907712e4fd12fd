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
// What caused an entry. The ledger stores it but never interprets it.

struct PurchaseReference
{
    std::string provider;
    std::string orderId;

    bool operator==(const PurchaseReference&) const = default;
};

struct CaptureReference
{
    std::string provider;
    std::string orderId;
    HoldId holdId;

    bool operator==(const CaptureReference&) const = default;
};

struct AdjustmentReference
{
    std::string actor;
    std::string note;

    bool operator==(const AdjustmentReference&) const = default;
};

struct RefundReference
{
    std::string provider;
    std::string orderId;
    std::optional<std::string> note;

    bool operator==(const RefundReference&) const = default;
};

using Reference =
    std::variant<PurchaseReference, CaptureReference, AdjustmentReference, RefundReference>;

//-------------------------------------------------------------------------

[[nodiscard]] EntryReason reasonOf(const Reference& reference) noexcept;

void serializeReference(
    rapidjson::Document& json, const Reference& reference, const std::string& key = {});

[[nodiscard]] Reference referenceFromJson(const rapidjson::Value& json);

[[nodiscard]] std::string referenceToString(const Reference& reference);

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------
