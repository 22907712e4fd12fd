/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "gemledger/ledger/BalanceCalculator.hpp"
#include "gemledger/ledger/HoldEngine.hpp"
#include "gemledger/ledger/IdentityResolver.hpp"
#include "gemledger/ledger/LedgerLog.hpp"
#include "gemledger/ledger/WalletDirectory.hpp"
#include "gemledger/money/MoneyCodec.hpp"
#include "gemledger/service/ServiceConfig.hpp"

//-------------------------------------------------------------------------

namespace gemledger::service
{

//-------------------------------------------------------------------------

struct HoldPlacement
{
    HoldId holdId;
    WalletId walletId;
    Timestamp expiresAt{};
    model::Balances balances;
    bool reused{};
};

struct RefundOutcome
{
    WalletId walletId;
    std::optional<HoldId> releasedHoldId;
    std::optional<EntryId> entryId;
    bool created{};
    model::Balances balances;
};

struct CreditOutcome
{
    WalletId walletId;
    EntryId entryId;
    bool created{};
    model::Balances balances;
};

//-------------------------------------------------------------------------
// The credit flows of the storefront, on top of the ledger modules. Callers
// only know the external identity of the user and the display amount.

class CreditService
{
public:
    CreditService(store::Store& store, ServiceConfig config, Clock clock = &systemNow);

    [[nodiscard]] const ServiceConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const money::MoneyCodec& codec() const noexcept { return m_codec; }
    [[nodiscard]] ledger::LedgerSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] ledger::WalletDirectory& wallets() noexcept { return m_wallets; }
    [[nodiscard]] ledger::LedgerLog& log() noexcept { return m_log; }
    [[nodiscard]] ledger::BalanceCalculator& balances() noexcept { return m_balances; }
    [[nodiscard]] ledger::HoldEngine& holds() noexcept { return m_holds; }
    [[nodiscard]] ledger::IdentityResolver& identities() noexcept { return m_identities; }

    HoldPlacement placeOrderHold(
        const OrganizationId& organizationId,
        const std::string& provider,
        const std::string& providerUserId,
        const std::string& orderId,
        std::string_view amount,
        std::optional<std::chrono::seconds> ttl = {});

    // Releases the order's active hold if there is one, credits otherwise.
    RefundOutcome refundOrder(
        const OrganizationId& organizationId,
        const std::string& provider,
        const std::string& providerUserId,
        const std::string& orderId,
        std::string_view amount,
        const std::optional<std::string>& note,
        const IdempotencyKey& idempotencyKey);

    CreditOutcome creditPurchase(
        const OrganizationId& organizationId,
        const std::string& provider,
        const std::string& providerUserId,
        const std::string& orderId,
        std::string_view amount,
        const IdempotencyKey& idempotencyKey);

    ledger::CaptureResult captureOrderHold(
        const OrganizationId& organizationId,
        const HoldId& holdId,
        const IdempotencyKey& idempotencyKey);

private:
    [[nodiscard]] model::Wallet resolveWallet(
        const OrganizationId& organizationId,
        const std::string& provider,
        const std::string& providerUserId);
    [[nodiscard]] MinorUnits positiveAmount(std::string_view amount) const;
    [[nodiscard]] std::chrono::seconds resolveTtl(std::optional<std::chrono::seconds> ttl) const;

    ServiceConfig m_config;
    money::MoneyCodec m_codec;
    ledger::LedgerSignals m_signals;
    ledger::WalletDirectory m_wallets;
    ledger::LedgerLog m_log;
    ledger::BalanceCalculator m_balances;
    ledger::HoldEngine m_holds;
    ledger::IdentityResolver m_identities;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::service

//-------------------------------------------------------------------------
