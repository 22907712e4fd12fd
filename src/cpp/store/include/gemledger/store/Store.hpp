/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "gemledger/store/Transaction.hpp"

#include <memory>

//-------------------------------------------------------------------------

namespace gemledger::store
{

//-------------------------------------------------------------------------

class Store
{
public:
    virtual ~Store() noexcept = default;

    [[nodiscard]] virtual std::unique_ptr<Transaction> begin(TransactionMode mode) = 0;

protected:
    Store() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::store

//-------------------------------------------------------------------------
