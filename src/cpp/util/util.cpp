/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "util.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

//-------------------------------------------------------------------------

namespace gemledger::util
{

//-------------------------------------------------------------------------

std::string generateId()
{
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

//-------------------------------------------------------------------------

const std::string& requireNonEmpty(
    const std::string& value, std::string_view field, std::source_location sl)
{
    if (value.empty()) {
        throw ValidationError{fmt::format("{}: '{}' must not be empty", sl.function_name(), field)};
    }
    return value;
}

//-------------------------------------------------------------------------

}  // namespace gemledger::util

//-------------------------------------------------------------------------
