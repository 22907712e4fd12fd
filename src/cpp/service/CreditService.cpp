/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/service/CreditService.hpp"

//-------------------------------------------------------------------------

namespace gemledger::service
{

//-------------------------------------------------------------------------

CreditService::CreditService(store::Store& store, ServiceConfig config, Clock clock)
    : m_config{std::move(config)},
      m_codec{m_config.currency().decimals},
      m_wallets{store, m_signals, clock},
      m_log{store, m_signals, clock},
      m_balances{store, clock},
      m_holds{store, m_log, m_signals, clock},
      m_identities{store, clock}
{}

//-------------------------------------------------------------------------

HoldPlacement CreditService::placeOrderHold(
    const OrganizationId& organizationId,
    const std::string& provider,
    const std::string& providerUserId,
    const std::string& orderId,
    std::string_view amount,
    std::optional<std::chrono::seconds> ttl)
{
    const MinorUnits minorUnits = positiveAmount(amount);
    util::requireNonEmpty(orderId, "orderId");

    const auto wallet = resolveWallet(organizationId, provider, providerUserId);

    if (auto existing = m_holds.findActiveHoldByOrder(organizationId, wallet.id, orderId)) {
        return {
            .holdId = existing->id,
            .walletId = wallet.id,
            .expiresAt = existing->expiresAt,
            .balances = m_balances.getBalances(organizationId, wallet.id),
            .reused = true
        };
    }

    const auto receipt = m_holds.placeHold(
        organizationId, wallet.id, provider, orderId, minorUnits, resolveTtl(ttl));
    return {
        .holdId = receipt.holdId,
        .walletId = wallet.id,
        .expiresAt = receipt.expiresAt,
        .balances = m_balances.getBalances(organizationId, wallet.id),
        .reused = receipt.reused
    };
}

//-------------------------------------------------------------------------

RefundOutcome CreditService::refundOrder(
    const OrganizationId& organizationId,
    const std::string& provider,
    const std::string& providerUserId,
    const std::string& orderId,
    std::string_view amount,
    const std::optional<std::string>& note,
    const IdempotencyKey& idempotencyKey)
{
    const MinorUnits minorUnits = positiveAmount(amount);
    util::requireNonEmpty(orderId, "orderId");
    util::requireNonEmpty(idempotencyKey, "idempotencyKey");

    const auto wallet = resolveWallet(organizationId, provider, providerUserId);

    if (auto hold = m_holds.findActiveHoldByOrder(organizationId, wallet.id, orderId)) {
        // A hold captured or expired in the meantime falls through to a credit.
        if (auto released = m_holds.releaseHold(organizationId, hold->id); released.changed) {
            return {
                .walletId = wallet.id,
                .releasedHoldId = hold->id,
                .balances = *released.balances
            };
        }
    }

    const auto insertion = m_log.insertLedgerEntry(
        organizationId,
        wallet.id,
        model::Direction::CREDIT,
        minorUnits,
        model::EntryReason::REFUND,
        model::RefundReference{.provider = provider, .orderId = orderId, .note = note},
        idempotencyKey);
    return {
        .walletId = wallet.id,
        .entryId = insertion.id,
        .created = insertion.created,
        .balances = m_balances.getBalances(organizationId, wallet.id)
    };
}

//-------------------------------------------------------------------------

CreditOutcome CreditService::creditPurchase(
    const OrganizationId& organizationId,
    const std::string& provider,
    const std::string& providerUserId,
    const std::string& orderId,
    std::string_view amount,
    const IdempotencyKey& idempotencyKey)
{
    const MinorUnits minorUnits = positiveAmount(amount);
    util::requireNonEmpty(orderId, "orderId");
    util::requireNonEmpty(idempotencyKey, "idempotencyKey");

    const auto wallet = resolveWallet(organizationId, provider, providerUserId);

    const auto insertion = m_log.insertLedgerEntry(
        organizationId,
        wallet.id,
        model::Direction::CREDIT,
        minorUnits,
        model::EntryReason::PURCHASE,
        model::PurchaseReference{.provider = provider, .orderId = orderId},
        idempotencyKey);
    return {
        .walletId = wallet.id,
        .entryId = insertion.id,
        .created = insertion.created,
        .balances = m_balances.getBalances(organizationId, wallet.id)
    };
}

//-------------------------------------------------------------------------

ledger::CaptureResult CreditService::captureOrderHold(
    const OrganizationId& organizationId,
    const HoldId& holdId,
    const IdempotencyKey& idempotencyKey)
{
    return m_holds.captureHold(organizationId, holdId, idempotencyKey);
}

//-------------------------------------------------------------------------

model::Wallet CreditService::resolveWallet(
    const OrganizationId& organizationId,
    const std::string& provider,
    const std::string& providerUserId)
{
    util::requireNonEmpty(organizationId, "organizationId");
    util::requireNonEmpty(provider, "provider");
    util::requireNonEmpty(providerUserId, "providerUserId");

    const auto userId =
        m_identities.findUserIdByExternalIdentity(organizationId, provider, providerUserId);
    if (!userId) {
        throw IdentityNotFound{fmt::format(
            "{}: {}/{} is not linked to a user in organization '{}'",
            std::source_location::current().function_name(),
            provider,
            providerUserId,
            organizationId)};
    }
    return m_wallets.ensureWallet(organizationId, *userId);
}

//-------------------------------------------------------------------------

MinorUnits CreditService::positiveAmount(std::string_view amount) const
{
    const MinorUnits minorUnits = m_codec.toMinorUnits(amount);
    if (minorUnits <= 0) {
        throw ValidationError{fmt::format(
            "{}: amount should be positive, was '{}'",
            std::source_location::current().function_name(),
            amount)};
    }
    return minorUnits;
}

//-------------------------------------------------------------------------

std::chrono::seconds CreditService::resolveTtl(std::optional<std::chrono::seconds> ttl) const
{
    const auto& holds = m_config.holds();
    if (!ttl) {
        return holds.defaultTtl;
    }
    if (*ttl < holds.minTtl || *ttl > holds.maxTtl) {
        throw ValidationError{fmt::format(
            "{}: ttl should be within [{}, {}] seconds, was {}",
            std::source_location::current().function_name(),
            holds.minTtl.count(),
            holds.maxTtl.count(),
            ttl->count())};
    }
    return *ttl;
}

//-------------------------------------------------------------------------

}  // namespace gemledger::service

//-------------------------------------------------------------------------
