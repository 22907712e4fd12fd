/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/store/LockManager.hpp"

//-------------------------------------------------------------------------

namespace gemledger::store
{

//-------------------------------------------------------------------------

LockManager::LockManager(std::chrono::milliseconds timeout) noexcept
    : m_timeout{timeout}
{}

//-------------------------------------------------------------------------

bool LockManager::acquire(const std::string& resource, TxnId owner)
{
    std::unique_lock lock{m_mtx};
    if (auto it = m_owners.find(resource); it != m_owners.end() && it->second == owner) {
        return true;
    }
    const bool granted = m_cv.wait_for(
        lock, m_timeout, [&] { return !m_owners.contains(resource); });
    if (!granted) {
        return false;
    }
    m_owners.emplace(resource, owner);
    return true;
}

//-------------------------------------------------------------------------

void LockManager::release(const std::string& resource, TxnId owner) noexcept
{
    {
        std::lock_guard lock{m_mtx};
        auto it = m_owners.find(resource);
        if (it == m_owners.end() || it->second != owner) {
            return;
        }
        m_owners.erase(it);
    }
    m_cv.notify_all();
}

//-------------------------------------------------------------------------

std::optional<TxnId> LockManager::owner(const std::string& resource) const
{
    std::lock_guard lock{m_mtx};
    if (auto it = m_owners.find(resource); it != m_owners.end()) {
        return it->second;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

size_t LockManager::size() const
{
    std::lock_guard lock{m_mtx};
    return m_owners.size();
}

//-------------------------------------------------------------------------

}  // namespace gemledger::store

//-------------------------------------------------------------------------
