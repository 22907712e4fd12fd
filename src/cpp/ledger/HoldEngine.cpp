/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/ledger/HoldEngine.hpp"

#include "gemledger/ledger/BalanceCalculator.hpp"
#include "gemledger/store/TransactionScope.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace gemledger::ledger
{

//-------------------------------------------------------------------------

using store::TransactionMode;
using store::TransactionScope;

//-------------------------------------------------------------------------

namespace
{

void transition(store::Transaction& txn, model::Hold& hold, model::HoldStatus status, Timestamp now)
{
    hold.status = status;
    hold.updatedAt = now;
    txn.updateHold(hold);
}

}  // namespace

//-------------------------------------------------------------------------

HoldEngine::HoldEngine(
    store::Store& store, LedgerLog& log, LedgerSignals& signals, Clock clock)
    : m_store{store}, m_log{log}, m_signals{signals}, m_clock{std::move(clock)}
{}

//-------------------------------------------------------------------------

HoldReceipt HoldEngine::createHold(
    const OrganizationId& organizationId,
    const WalletId& walletId,
    const std::string& provider,
    const std::string& orderId,
    MinorUnits amount,
    std::chrono::seconds ttl)
{
    return reserve(organizationId, walletId, provider, orderId, amount, ttl, false);
}

//-------------------------------------------------------------------------

HoldReceipt HoldEngine::placeHold(
    const OrganizationId& organizationId,
    const WalletId& walletId,
    const std::string& provider,
    const std::string& orderId,
    MinorUnits amount,
    std::chrono::seconds ttl)
{
    return reserve(organizationId, walletId, provider, orderId, amount, ttl, true);
}

//-------------------------------------------------------------------------

HoldReceipt HoldEngine::reserve(
    const OrganizationId& organizationId,
    const WalletId& walletId,
    const std::string& provider,
    const std::string& orderId,
    MinorUnits amount,
    std::chrono::seconds ttl,
    bool reuseActive)
{
    util::requireNonEmpty(organizationId, "organizationId");
    util::requireNonEmpty(walletId, "walletId");
    util::requireNonEmpty(provider, "provider");
    util::requireNonEmpty(orderId, "orderId");
    if (amount <= 0) {
        throw ValidationError{fmt::format(
            "{}: amount should be a positive number of minor units, was {}",
            std::source_location::current().function_name(),
            amount)};
    }
    if (ttl <= std::chrono::seconds::zero() || ttl > kMaxTtl) {
        throw ValidationError{fmt::format(
            "{}: ttl should be within (0, {}] seconds, was {}s",
            std::source_location::current().function_name(),
            kMaxTtl.count(),
            ttl.count())};
    }

    const auto now = m_clock();
    TransactionScope txn{m_store, TransactionMode::READ_WRITE};

    const auto wallet = txn->lockWallet(organizationId, walletId);
    if (!wallet) {
        throw WalletNotFound{fmt::format(
            "{}: no wallet '{}' in organization '{}'",
            std::source_location::current().function_name(),
            walletId,
            organizationId)};
    }
    if (reuseActive) {
        // Checked under the wallet lock so concurrent placements of one order agree.
        if (auto existing = txn->findActiveHoldByOrder(organizationId, walletId, orderId, now)) {
            return {.holdId = existing->id, .expiresAt = existing->expiresAt, .reused = true};
        }
    }
    if (wallet->isFrozen()) {
        throw WalletFrozen{fmt::format(
            "{}: wallet '{}' is frozen", std::source_location::current().function_name(), walletId)};
    }

    const auto balances = BalanceCalculator::compute(*txn, organizationId, walletId, now);
    if (amount > balances.available) {
        throw InsufficientFunds{fmt::format(
            "{}: cannot hold {} on wallet '{}', only {} available",
            std::source_location::current().function_name(),
            amount,
            walletId,
            balances.available)};
    }

    const model::Hold hold{
        .id = util::generateId(),
        .organizationId = organizationId,
        .walletId = walletId,
        .provider = provider,
        .orderId = orderId,
        .amount = amount,
        .status = model::HoldStatus::ACTIVE,
        .expiresAt = now + ttl,
        .createdAt = now,
        .updatedAt = now
    };
    txn->insertHold(hold);
    txn.commit();

    m_signals.holdTransitioned(hold);
    return {.holdId = hold.id, .expiresAt = hold.expiresAt};
}

//-------------------------------------------------------------------------

CaptureResult HoldEngine::captureHold(
    const OrganizationId& organizationId,
    const HoldId& holdId,
    const IdempotencyKey& idempotencyKey)
{
    util::requireNonEmpty(organizationId, "organizationId");
    util::requireNonEmpty(holdId, "holdId");
    util::requireNonEmpty(idempotencyKey, "idempotencyKey");

    const auto now = m_clock();
    model::Hold hold;
    AppendResult debit;
    {
        TransactionScope txn{m_store, TransactionMode::READ_WRITE};

        auto locked = txn->lockHold(organizationId, holdId);
        if (!locked) {
            throw HoldNotFound{fmt::format(
                "{}: no hold '{}' in organization '{}'",
                std::source_location::current().function_name(),
                holdId,
                organizationId)};
        }
        hold = std::move(*locked);

        if (hold.isOverdue(now)) {
            transition(*txn, hold, model::HoldStatus::EXPIRED, now);
            txn.commit();
            m_signals.holdTransitioned(hold);
            throw HoldNotActive{fmt::format(
                "{}: hold '{}' expired at {}",
                std::source_location::current().function_name(),
                holdId,
                toEpochMillis(hold.expiresAt))};
        }
        if (hold.isTerminal()) {
            throw HoldNotActive{fmt::format(
                "{}: hold '{}' is already {}",
                std::source_location::current().function_name(),
                holdId,
                hold.status)};
        }

        const model::CaptureReference reference{
            .provider = hold.provider,
            .orderId = hold.orderId,
            .holdId = hold.id
        };
        debit = m_log.append(
            *txn,
            model::LedgerEntry{
                .organizationId = organizationId,
                .walletId = hold.walletId,
                .direction = model::Direction::DEBIT,
                .amount = hold.amount,
                .reason = model::EntryReason::CAPTURE,
                .reference = reference,
                .idempotencyKey = idempotencyKey
            },
            now);
        // A replayed key must belong to this very capture, otherwise the hold
        // would be marked captured without any debit behind it.
        if (!debit.created && debit.entry.reference != model::Reference{reference}) {
            throw ConflictError{fmt::format(
                "{}: idempotency key '{}' already records entry {} on wallet '{}'",
                std::source_location::current().function_name(),
                idempotencyKey,
                debit.entry.id,
                hold.walletId)};
        }

        transition(*txn, hold, model::HoldStatus::CAPTURED, now);
        txn.commit();
    }

    if (debit.created) {
        m_signals.entryAppended(debit.entry);
    }
    m_signals.holdTransitioned(hold);

    return {
        .walletId = hold.walletId,
        .entryId = debit.entry.id,
        .balances = readBalances(organizationId, hold.walletId, now)
    };
}

//-------------------------------------------------------------------------

ReleaseResult HoldEngine::releaseHold(const OrganizationId& organizationId, const HoldId& holdId)
{
    util::requireNonEmpty(organizationId, "organizationId");
    util::requireNonEmpty(holdId, "holdId");

    const auto now = m_clock();
    model::Hold hold;
    {
        TransactionScope txn{m_store, TransactionMode::READ_WRITE};

        auto locked = txn->lockHold(organizationId, holdId);
        if (!locked || locked->isTerminal()) {
            return {.changed = false};
        }
        hold = std::move(*locked);

        if (hold.isOverdue(now)) {
            transition(*txn, hold, model::HoldStatus::EXPIRED, now);
            txn.commit();
            m_signals.holdTransitioned(hold);
            return {.changed = false};
        }

        transition(*txn, hold, model::HoldStatus::RELEASED, now);
        txn.commit();
    }

    m_signals.holdTransitioned(hold);
    return {
        .changed = true,
        .walletId = hold.walletId,
        .balances = readBalances(organizationId, hold.walletId, now)
    };
}

//-------------------------------------------------------------------------

std::optional<model::Hold> HoldEngine::findActiveHoldByOrder(
    const OrganizationId& organizationId,
    const WalletId& walletId,
    const std::string& orderId)
{
    const auto now = m_clock();
    TransactionScope txn{m_store, TransactionMode::READ_ONLY};
    return txn->findActiveHoldByOrder(organizationId, walletId, orderId, now);
}

//-------------------------------------------------------------------------

std::optional<model::Hold> HoldEngine::getHold(
    const OrganizationId& organizationId, const HoldId& holdId)
{
    TransactionScope txn{m_store, TransactionMode::READ_ONLY};
    return txn->getHold(organizationId, holdId);
}

//-------------------------------------------------------------------------

size_t HoldEngine::expireHolds(size_t limit)
{
    const auto now = m_clock();
    std::vector<model::Hold> overdue;
    {
        TransactionScope txn{m_store, TransactionMode::READ_ONLY};
        overdue = txn->listOverdueHolds(now, limit);
    }

    size_t expired{};
    for (const auto& candidate : overdue) {
        TransactionScope txn{m_store, TransactionMode::READ_WRITE};
        auto hold = txn->lockHold(candidate.organizationId, candidate.id);
        // Captured or released while we were not holding the lock.
        if (!hold || !hold->isOverdue(now)) continue;
        transition(*txn, *hold, model::HoldStatus::EXPIRED, now);
        txn.commit();
        m_signals.holdTransitioned(*hold);
        ++expired;
    }

    if (expired > 0) {
        spdlog::info("Expired {} overdue holds", expired);
    }
    return expired;
}

//-------------------------------------------------------------------------

model::Balances HoldEngine::readBalances(
    const OrganizationId& organizationId, const WalletId& walletId, Timestamp now)
{
    TransactionScope txn{m_store, TransactionMode::READ_ONLY};
    return BalanceCalculator::compute(*txn, organizationId, walletId, now);
}

//-------------------------------------------------------------------------

}  // namespace gemledger::ledger

//-------------------------------------------------------------------------
