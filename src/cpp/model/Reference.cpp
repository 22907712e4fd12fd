/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/model/Reference.hpp"

//-------------------------------------------------------------------------

namespace gemledger::model
{

//-------------------------------------------------------------------------

EntryReason reasonOf(const Reference& reference) noexcept
{
    return std::visit(
        [](auto&& item) -> EntryReason {
            using T = std::remove_cvref_t<decltype(item)>;
            if constexpr (std::same_as<T, PurchaseReference>) {
                return EntryReason::PURCHASE;
            } else if constexpr (std::same_as<T, CaptureReference>) {
                return EntryReason::CAPTURE;
            } else if constexpr (std::same_as<T, AdjustmentReference>) {
                return EntryReason::MANUAL_ADJUSTMENT;
            } else if constexpr (std::same_as<T, RefundReference>) {
                return EntryReason::REFUND;
            } else {
                static_assert(false, "Unknown Reference type");
            }
        },
        reference);
}

//-------------------------------------------------------------------------

void serializeReference(
    rapidjson::Document& json, const Reference& reference, const std::string& key)
{
    auto serialize = [&reference](rapidjson::Document& json) {
        json.SetObject();
        json::addString(json, "type", util::enumName(reasonOf(reference)));
        std::visit(
            [&json](auto&& item) {
                using T = std::remove_cvref_t<decltype(item)>;
                if constexpr (std::same_as<T, PurchaseReference>) {
                    json::addString(json, "provider", item.provider);
                    json::addString(json, "orderId", item.orderId);
                } else if constexpr (std::same_as<T, CaptureReference>) {
                    json::addString(json, "provider", item.provider);
                    json::addString(json, "orderId", item.orderId);
                    json::addString(json, "holdId", item.holdId);
                } else if constexpr (std::same_as<T, AdjustmentReference>) {
                    json::addString(json, "actor", item.actor);
                    json::addString(json, "note", item.note);
                } else if constexpr (std::same_as<T, RefundReference>) {
                    json::addString(json, "provider", item.provider);
                    json::addString(json, "orderId", item.orderId);
                    json::setOptionalMember(json, "note", item.note);
                } else {
                    static_assert(false, "Unknown Reference type");
                }
            },
            reference);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Reference referenceFromJson(const rapidjson::Value& json)
{
    switch (util::parseEnum<EntryReason>(json::getString(json, "type"))) {
        case EntryReason::PURCHASE:
            return PurchaseReference{
                .provider = json::getString(json, "provider"),
                .orderId = json::getString(json, "orderId")
            };
        case EntryReason::CAPTURE:
            return CaptureReference{
                .provider = json::getString(json, "provider"),
                .orderId = json::getString(json, "orderId"),
                .holdId = json::getString(json, "holdId")
            };
        case EntryReason::MANUAL_ADJUSTMENT:
            return AdjustmentReference{
                .actor = json::getString(json, "actor"),
                .note = json::getString(json, "note")
            };
        case EntryReason::REFUND:
            return RefundReference{
                .provider = json::getString(json, "provider"),
                .orderId = json::getString(json, "orderId"),
                .note = json::getOptionalString(json, "note")
            };
    }
    throw std::invalid_argument{fmt::format(
        "{}: Unhandled reference type in {}",
        std::source_location::current().function_name(),
        json::json2str(json))};
}

//-------------------------------------------------------------------------

std::string referenceToString(const Reference& reference)
{
    rapidjson::Document json;
    serializeReference(json, reference);
    return json::json2str(json);
}

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------
