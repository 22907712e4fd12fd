/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "gemledger/model/Balances.hpp"
#include "gemledger/model/Hold.hpp"
#include "gemledger/model/LedgerEntry.hpp"

#include <ostream>

//-------------------------------------------------------------------------

namespace gemledger::model
{

inline void PrintTo(const Balances& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

inline void PrintTo(const Hold& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

inline void PrintTo(const LedgerEntry& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

}  // namespace gemledger::model

//-------------------------------------------------------------------------
