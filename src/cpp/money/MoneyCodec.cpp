/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/money/MoneyCodec.hpp"

#include "LedgerException.hpp"

#include <limits>

//-------------------------------------------------------------------------

namespace gemledger::money
{

//-------------------------------------------------------------------------

MoneyCodec::MoneyCodec(uint32_t decimals)
    : m_decimals{decimals}, m_factor{1}
{
    if (!(decimals > 0 && decimals <= kMaxDecimals)) {
        throw std::invalid_argument{fmt::format(
            "{}: decimals should be in (0, {}], was {}",
            std::source_location::current().function_name(),
            kMaxDecimals,
            decimals)};
    }
    for (uint32_t i = 0; i < m_decimals; ++i) {
        m_factor *= 10;
    }
}

//-------------------------------------------------------------------------

MinorUnits MoneyCodec::toMinorUnits(decimal_t amount) const
{
    static constexpr auto ctx = std::source_location::current().function_name();
    static constexpr uint64_t kMaxMagnitude = std::numeric_limits<MinorUnits>::max();

    if (!util::isFinite(amount)) {
        throw ValidationError{fmt::format("{}: Amount {} is not finite", ctx, amount)};
    }

    const auto [sign, significand, exponent] =
        util::decompose(util::roundHalfAway(util::scaleByPowerOf10(amount, m_decimals)));

    uint64_t magnitude = significand;
    for (int e = exponent; e > 0; --e) {
        if (magnitude > kMaxMagnitude / 10) {
            throw ValidationError{fmt::format(
                "{}: Amount {} exceeds the representable range", ctx, amount)};
        }
        magnitude *= 10;
    }
    // Rounded to an integral value, so the dropped digits are zeros.
    for (int e = exponent; e < 0; ++e) {
        magnitude /= 10;
    }
    if (magnitude > kMaxMagnitude) {
        throw ValidationError{fmt::format(
            "{}: Amount {} exceeds the representable range", ctx, amount)};
    }

    const auto value = static_cast<MinorUnits>(magnitude);
    return sign < 0 ? -value : value;
}

//-------------------------------------------------------------------------

MinorUnits MoneyCodec::toMinorUnits(std::string_view amount) const
{
    return toMinorUnits(parse(amount));
}

//-------------------------------------------------------------------------

std::string MoneyCodec::toDecimalString(MinorUnits amount) const
{
    const bool negative = amount < 0;
    const uint64_t magnitude = negative
        ? uint64_t{0} - static_cast<uint64_t>(amount)
        : static_cast<uint64_t>(amount);
    return fmt::format(
        "{}{}.{:0{}}",
        negative ? "-" : "",
        magnitude / m_factor,
        magnitude % m_factor,
        m_decimals);
}

//-------------------------------------------------------------------------

decimal_t MoneyCodec::parse(std::string_view amount)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    // Digits from the first to the last non-zero one.
    size_t significantDigits{};
    const bool wellFormed = [&] {
        if (amount.empty()) return false;
        size_t pos = amount.front() == '-' ? 1 : 0;
        size_t digits{}, points{};
        std::optional<size_t> firstNonZero;
        for (; pos < amount.size(); ++pos) {
            const char c = amount[pos];
            if (c >= '0' && c <= '9') {
                if (c != '0') {
                    if (!firstNonZero) firstNonZero = digits;
                    significantDigits = digits - *firstNonZero + 1;
                }
                ++digits;
            } else if (c == '.') {
                ++points;
            } else {
                return false;
            }
        }
        return digits > 0 && points <= 1;
    }();
    if (!wellFormed) {
        throw ValidationError{fmt::format("{}: '{}' is not a decimal amount", ctx, amount)};
    }
    if (significantDigits > kMaxSignificantDigits) {
        throw ValidationError{fmt::format(
            "{}: '{}' has more than {} significant digits",
            ctx,
            amount,
            kMaxSignificantDigits)};
    }

    auto parsed = util::parseDecimal(amount);
    if (!parsed.has_value() || !util::isFinite(*parsed)) {
        throw ValidationError{fmt::format("{}: '{}' is not a decimal amount", ctx, amount)};
    }
    return *parsed;
}

//-------------------------------------------------------------------------

}  // namespace gemledger::money

//-------------------------------------------------------------------------
