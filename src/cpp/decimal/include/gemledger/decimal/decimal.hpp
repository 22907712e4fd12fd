/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalutil.h>
#include <bsls_types.h>
#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <spanstream>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace gemledger
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

}  // namespace gemledger

//-------------------------------------------------------------------------

namespace gemledger::util
{

struct DecimalParts
{
    int sign;
    uint64_t significand;
    int exponent;
};

// Half-way cases round away from zero.
[[nodiscard]] inline decimal_t roundHalfAway(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalUtil::round(val);
}

[[nodiscard]] inline decimal_t scaleByPowerOf10(decimal_t val, uint32_t exponent)
{
    return BloombergLP::bdldfp::DecimalUtil::multiplyByPowerOf10(
        val, static_cast<int>(exponent));
}

[[nodiscard]] inline bool isFinite(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalUtil::isFinite(val);
}

[[nodiscard]] inline DecimalParts decompose(decimal_t val)
{
    DecimalParts parts{};
    BloombergLP::bsls::Types::Uint64 significand{};
    BloombergLP::bdldfp::DecimalUtil::decompose(
        &parts.sign, &significand, &parts.exponent, val);
    parts.significand = significand;
    return parts;
}

[[nodiscard]] inline std::optional<decimal_t> parseDecimal(std::string_view str)
{
    const std::string buf{str};
    decimal_t val;
    if (BloombergLP::bdldfp::DecimalUtil::parseDecimal64(&val, buf.c_str()) != 0) {
        return std::nullopt;
    }
    return val;
}

}  // namespace gemledger::util

//-------------------------------------------------------------------------

namespace gemledger::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace gemledger::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<gemledger::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(gemledger::decimal_t val, FormatContext& ctx) const
    {
        using namespace gemledger::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
