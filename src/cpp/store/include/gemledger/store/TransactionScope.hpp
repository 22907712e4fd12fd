/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "gemledger/store/Store.hpp"

//-------------------------------------------------------------------------

namespace gemledger::store
{

//-------------------------------------------------------------------------
// Begins on construction; anything short of commit() rolls back.

class TransactionScope
{
public:
    TransactionScope(Store& store, TransactionMode mode);
    ~TransactionScope() noexcept;

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;
    TransactionScope(TransactionScope&&) = delete;
    TransactionScope& operator=(TransactionScope&&) = delete;

    [[nodiscard]] Transaction& operator*() noexcept { return *m_txn; }
    [[nodiscard]] Transaction* operator->() noexcept { return m_txn.get(); }

    void commit();
    void rollback() noexcept;

private:
    std::unique_ptr<Transaction> m_txn;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::store

//-------------------------------------------------------------------------
