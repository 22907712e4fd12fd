/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/model/Balances.hpp"

//-------------------------------------------------------------------------

namespace gemledger::model
{

//-------------------------------------------------------------------------

void Balances::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("available", rapidjson::Value{static_cast<int64_t>(available)}, allocator);
        json.AddMember("onHold", rapidjson::Value{static_cast<int64_t>(onHold)}, allocator);
        json.AddMember("balance", rapidjson::Value{static_cast<int64_t>(balance)}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Balances Balances::fromAggregates(MinorUnits credited, MinorUnits debited, MinorUnits held)
{
    if (credited < 0 || debited < 0 || held < 0) {
        throw std::runtime_error{fmt::format(
            "{}: Negative aggregate in accounting (credited {} | debited {} | held {})",
            std::source_location::current().function_name(),
            credited,
            debited,
            held)};
    }
    const MinorUnits available = credited - debited - held;
    return Balances{
        .available = available,
        .onHold = held,
        .balance = available + held
    };
}

//-------------------------------------------------------------------------

}  // namespace gemledger::model

//-------------------------------------------------------------------------
