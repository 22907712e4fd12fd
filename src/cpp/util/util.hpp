/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "LedgerException.hpp"
#include "common.hpp"

#include <boost/algorithm/string/case_conv.hpp>

//-------------------------------------------------------------------------

namespace gemledger::util
{

//-------------------------------------------------------------------------

[[nodiscard]] std::string generateId();

template<typename E>
requires std::is_enum_v<E>
[[nodiscard]] std::string enumName(E value)
{
    return boost::algorithm::to_lower_copy(std::string{magic_enum::enum_name(value)});
}

template<typename E>
requires std::is_enum_v<E>
[[nodiscard]] std::optional<E> enumFromName(std::string_view name) noexcept
{
    return magic_enum::enum_cast<E>(name, magic_enum::case_insensitive);
}

template<typename E>
requires std::is_enum_v<E>
[[nodiscard]] E parseEnum(
    std::string_view name, std::source_location sl = std::source_location::current())
{
    if (auto value = enumFromName<E>(name)) {
        return *value;
    }
    throw ValidationError{fmt::format(
        "{}: '{}' is not a valid {}",
        sl.function_name(),
        name,
        magic_enum::enum_type_name<E>())};
}

template<typename E>
requires std::is_enum_v<E>
E validateEnum(E value, std::source_location sl = std::source_location::current())
{
    if (!magic_enum::enum_contains(value)) {
        throw ValidationError{fmt::format(
            "{}: {} is not a valid {}",
            sl.function_name(),
            magic_enum::enum_integer(value),
            magic_enum::enum_type_name<E>())};
    }
    return value;
}

const std::string& requireNonEmpty(
    const std::string& value,
    std::string_view field,
    std::source_location sl = std::source_location::current());

//-------------------------------------------------------------------------

}  // namespace gemledger::util

//-------------------------------------------------------------------------
