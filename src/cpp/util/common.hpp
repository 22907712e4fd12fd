/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Timestamp.hpp"

#include <boost/signals2.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <range/v3/all.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace bs2 = boost::signals2;
namespace views = ranges::views;

//-------------------------------------------------------------------------

namespace gemledger
{

using MinorUnits = int64_t;

using OrganizationId = std::string;
using UserId = std::string;
using WalletId = std::string;
using EntryId = std::string;
using HoldId = std::string;
using IdempotencyKey = std::string;

inline constexpr std::string_view kCurrencyCode = "GEMS";

// Slots run on the committing thread, so the signal keeps its own mutex.
template<typename SlotType>
requires requires { typename std::function<SlotType>; }
using SyncSignal = bs2::signal<SlotType>;

}  // namespace gemledger

//-------------------------------------------------------------------------
