/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/store/TransactionScope.hpp"

//-------------------------------------------------------------------------

namespace gemledger::store
{

//-------------------------------------------------------------------------

TransactionScope::TransactionScope(Store& store, TransactionMode mode)
    : m_txn{store.begin(mode)}
{}

//-------------------------------------------------------------------------

TransactionScope::~TransactionScope() noexcept
{
    rollback();
}

//-------------------------------------------------------------------------

void TransactionScope::commit()
{
    m_txn->commit();
}

//-------------------------------------------------------------------------

void TransactionScope::rollback() noexcept
{
    if (m_txn->isOpen()) {
        m_txn->rollback();
    }
}

//-------------------------------------------------------------------------

}  // namespace gemledger::store

//-------------------------------------------------------------------------
