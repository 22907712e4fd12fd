/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/ledger/LedgerLog.hpp"

#include "gemledger/store/TransactionScope.hpp"

#include <spdlog/spdlog.h>

#include <limits>

//-------------------------------------------------------------------------

namespace gemledger::ledger
{

//-------------------------------------------------------------------------

using store::TransactionMode;
using store::TransactionScope;

//-------------------------------------------------------------------------

namespace
{

bool samePayload(const model::LedgerEntry& lhs, const model::LedgerEntry& rhs)
{
    return lhs.organizationId == rhs.organizationId
        && lhs.direction == rhs.direction
        && lhs.amount == rhs.amount
        && lhs.reason == rhs.reason
        && lhs.reference == rhs.reference;
}

}  // namespace

//-------------------------------------------------------------------------

LedgerLog::LedgerLog(store::Store& store, LedgerSignals& signals, Clock clock)
    : m_store{store}, m_signals{signals}, m_clock{std::move(clock)}
{}

//-------------------------------------------------------------------------

EntryInsertion LedgerLog::insertLedgerEntry(
    const OrganizationId& organizationId,
    const WalletId& walletId,
    model::Direction direction,
    MinorUnits amount,
    model::EntryReason reason,
    const model::Reference& reference,
    const IdempotencyKey& idempotencyKey)
{
    model::LedgerEntry draft{
        .organizationId = organizationId,
        .walletId = walletId,
        .direction = direction,
        .amount = amount,
        .reason = reason,
        .reference = reference,
        .idempotencyKey = idempotencyKey
    };
    validate(draft);

    TransactionScope txn{m_store, TransactionMode::READ_WRITE};
    auto [entry, created] = append(*txn, std::move(draft), m_clock());
    txn.commit();

    if (created) {
        m_signals.entryAppended(entry);
    }
    return {.id = entry.id, .created = created};
}

//-------------------------------------------------------------------------

std::vector<model::LedgerEntry> LedgerLog::history(
    const OrganizationId& organizationId, const WalletId& walletId)
{
    TransactionScope txn{m_store, TransactionMode::READ_ONLY};
    return txn->listEntries(organizationId, walletId);
}

//-------------------------------------------------------------------------

AppendResult LedgerLog::append(store::Transaction& txn, model::LedgerEntry draft, Timestamp now)
{
    const auto replay = [&](const model::LedgerEntry& existing) {
        if (!samePayload(existing, draft)) {
            spdlog::warn(
                "Idempotency key '{}' on wallet {} replayed with a different payload; "
                "keeping stored entry {}",
                draft.idempotencyKey,
                draft.walletId,
                existing.id);
        }
        return AppendResult{.entry = existing, .created = false};
    };

    const auto wallet = txn.getWallet(draft.organizationId, draft.walletId);
    if (!wallet) {
        throw WalletNotFound{fmt::format(
            "{}: no wallet '{}' in organization '{}'",
            std::source_location::current().function_name(),
            draft.walletId,
            draft.organizationId)};
    }

    if (auto existing = txn.findEntryByKey(draft.walletId, draft.idempotencyKey)) {
        return replay(*existing);
    }

    const auto locked = txn.lockWallet(draft.organizationId, draft.walletId);

    // Captures realize funds that were reserved before any freeze.
    if (draft.direction == model::Direction::DEBIT
        && draft.reason != model::EntryReason::CAPTURE
        && locked->isFrozen()) {
        throw WalletFrozen{fmt::format(
            "{}: wallet '{}' is frozen", std::source_location::current().function_name(), locked->id)};
    }

    const MinorUnits total = txn.sumEntries(draft.organizationId, draft.walletId, draft.direction);
    if (draft.amount > std::numeric_limits<MinorUnits>::max() - total) {
        throw ValidationError{fmt::format(
            "{}: {} of {} on wallet '{}' would overflow its {} total of {}",
            std::source_location::current().function_name(),
            draft.direction,
            draft.amount,
            draft.walletId,
            draft.direction,
            total)};
    }

    draft.id = util::generateId();
    draft.createdAt = now;
    try {
        txn.insertEntry(draft);
    }
    catch (const store::UniqueViolation&) {
        if (auto existing = txn.findEntryByKey(draft.walletId, draft.idempotencyKey)) {
            return replay(*existing);
        }
        throw;
    }
    return {.entry = std::move(draft), .created = true};
}

//-------------------------------------------------------------------------

void LedgerLog::validate(const model::LedgerEntry& draft)
{
    util::requireNonEmpty(draft.organizationId, "organizationId");
    util::requireNonEmpty(draft.walletId, "walletId");
    util::requireNonEmpty(draft.idempotencyKey, "idempotencyKey");
    util::validateEnum(draft.direction);
    util::validateEnum(draft.reason);

    if (draft.amount <= 0) {
        throw ValidationError{fmt::format(
            "{}: amount should be a positive number of minor units, was {}",
            std::source_location::current().function_name(),
            draft.amount)};
    }

    using enum model::EntryReason;
    const bool directionMatches = [&] {
        switch (draft.reason) {
            case PURCHASE:
            case REFUND:
                return draft.direction == model::Direction::CREDIT;
            case CAPTURE:
                return draft.direction == model::Direction::DEBIT;
            case MANUAL_ADJUSTMENT:
                return true;
        }
        return false;
    }();
    if (!directionMatches) {
        throw ValidationError{fmt::format(
            "{}: reason {} cannot be recorded as a {}",
            std::source_location::current().function_name(),
            draft.reason,
            draft.direction)};
    }

    if (const auto referenceReason = model::reasonOf(draft.reference);
        referenceReason != draft.reason) {
        throw ValidationError{fmt::format(
            "{}: {} reference given for reason {}",
            std::source_location::current().function_name(),
            referenceReason,
            draft.reason)};
    }
}

//-------------------------------------------------------------------------

}  // namespace gemledger::ledger

//-------------------------------------------------------------------------
