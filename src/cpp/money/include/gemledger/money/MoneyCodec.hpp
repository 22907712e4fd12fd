/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "gemledger/decimal/decimal.hpp"

//-------------------------------------------------------------------------

namespace gemledger::money
{

//-------------------------------------------------------------------------

inline constexpr uint32_t kDefaultDecimals = 2;
inline constexpr uint32_t kMaxDecimals = 6;
// Precision of Decimal64; longer inputs are rejected rather than rounded.
inline constexpr size_t kMaxSignificantDigits = 16;

//-------------------------------------------------------------------------
// Exact conversion between display amounts and integer minor units.
// Display amounts go through Decimal64 only; binary floating point never
// touches a stored value.

class MoneyCodec
{
public:
    explicit MoneyCodec(uint32_t decimals = kDefaultDecimals);

    [[nodiscard]] uint32_t decimals() const noexcept { return m_decimals; }
    [[nodiscard]] uint64_t factor() const noexcept { return m_factor; }

    [[nodiscard]] MinorUnits toMinorUnits(decimal_t amount) const;
    [[nodiscard]] MinorUnits toMinorUnits(std::string_view amount) const;
    [[nodiscard]] std::string toDecimalString(MinorUnits amount) const;

    [[nodiscard]] static decimal_t parse(std::string_view amount);

private:
    uint32_t m_decimals;
    uint64_t m_factor;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::money

//-------------------------------------------------------------------------
