/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

//-------------------------------------------------------------------------

namespace gemledger
{

//-------------------------------------------------------------------------

using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;
using Clock = std::function<Timestamp()>;

[[nodiscard]] inline Timestamp systemNow() noexcept
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

[[nodiscard]] inline int64_t toEpochMillis(Timestamp ts) noexcept
{
    return ts.time_since_epoch().count();
}

[[nodiscard]] inline Timestamp fromEpochMillis(int64_t millis) noexcept
{
    return Timestamp{std::chrono::milliseconds{millis}};
}

//-------------------------------------------------------------------------

}  // namespace gemledger

//-------------------------------------------------------------------------
