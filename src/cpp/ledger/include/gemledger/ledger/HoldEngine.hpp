/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "gemledger/ledger/LedgerLog.hpp"
#include "gemledger/model/Balances.hpp"

//-------------------------------------------------------------------------

namespace gemledger::ledger
{

//-------------------------------------------------------------------------

struct HoldReceipt
{
    HoldId holdId;
    Timestamp expiresAt{};
    bool reused{};
};

struct CaptureResult
{
    WalletId walletId;
    EntryId entryId;
    model::Balances balances;
};

struct ReleaseResult
{
    bool changed{};
    std::optional<WalletId> walletId;
    std::optional<model::Balances> balances;
};

//-------------------------------------------------------------------------
// Hold state machine: active -> captured | released | expired.
//
// An active hold past its expiry is overdue: it reserves nothing, and the
// first capture, release or sweep that touches it persists the expiry.
// Creation checks the available balance under the wallet row lock, which
// debits take as well.

class HoldEngine
{
public:
    static constexpr std::chrono::seconds kMaxTtl{std::chrono::days{366}};

    HoldEngine(
        store::Store& store, LedgerLog& log, LedgerSignals& signals, Clock clock = &systemNow);

    HoldReceipt createHold(
        const OrganizationId& organizationId,
        const WalletId& walletId,
        const std::string& provider,
        const std::string& orderId,
        MinorUnits amount,
        std::chrono::seconds ttl);

    // Like createHold, but returns the order's non-overdue active hold when
    // there is one.
    HoldReceipt placeHold(
        const OrganizationId& organizationId,
        const WalletId& walletId,
        const std::string& provider,
        const std::string& orderId,
        MinorUnits amount,
        std::chrono::seconds ttl);

    CaptureResult captureHold(
        const OrganizationId& organizationId,
        const HoldId& holdId,
        const IdempotencyKey& idempotencyKey);

    ReleaseResult releaseHold(const OrganizationId& organizationId, const HoldId& holdId);

    [[nodiscard]] std::optional<model::Hold> findActiveHoldByOrder(
        const OrganizationId& organizationId,
        const WalletId& walletId,
        const std::string& orderId);

    [[nodiscard]] std::optional<model::Hold> getHold(
        const OrganizationId& organizationId, const HoldId& holdId);

    // Persists the expiry of up to `limit` overdue holds, one transaction each.
    size_t expireHolds(size_t limit);

private:
    HoldReceipt reserve(
        const OrganizationId& organizationId,
        const WalletId& walletId,
        const std::string& provider,
        const std::string& orderId,
        MinorUnits amount,
        std::chrono::seconds ttl,
        bool reuseActive);

    [[nodiscard]] model::Balances readBalances(
        const OrganizationId& organizationId, const WalletId& walletId, Timestamp now);

    store::Store& m_store;
    LedgerLog& m_log;
    LedgerSignals& m_signals;
    Clock m_clock;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::ledger

//-------------------------------------------------------------------------
