/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

//-------------------------------------------------------------------------

namespace gemledger::store
{

//-------------------------------------------------------------------------

using TxnId = uint64_t;

//-------------------------------------------------------------------------
// Exclusive, owner-reentrant locks on named resources (rows and unique keys).

class LockManager
{
public:
    explicit LockManager(std::chrono::milliseconds timeout) noexcept;

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return m_timeout; }

    // False when the resource stayed busy for longer than the timeout.
    [[nodiscard]] bool acquire(const std::string& resource, TxnId owner);
    void release(const std::string& resource, TxnId owner) noexcept;

    [[nodiscard]] std::optional<TxnId> owner(const std::string& resource) const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex m_mtx;
    std::condition_variable m_cv;
    std::unordered_map<std::string, TxnId> m_owners;
    std::chrono::milliseconds m_timeout;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::store

//-------------------------------------------------------------------------
