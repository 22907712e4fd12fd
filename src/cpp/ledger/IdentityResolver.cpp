/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/ledger/IdentityResolver.hpp"

#include "gemledger/store/TransactionScope.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace gemledger::ledger
{

//-------------------------------------------------------------------------

using store::TransactionMode;
using store::TransactionScope;

//-------------------------------------------------------------------------

IdentityResolver::IdentityResolver(store::Store& store, Clock clock)
    : m_store{store}, m_clock{std::move(clock)}
{}

//-------------------------------------------------------------------------

std::optional<UserId> IdentityResolver::findUserIdByExternalIdentity(
    const OrganizationId& organizationId,
    const std::string& provider,
    const std::string& providerUserId)
{
    TransactionScope txn{m_store, TransactionMode::READ_ONLY};
    if (auto identity = txn->findIdentity({organizationId, provider, providerUserId})) {
        return identity->userId;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

void IdentityResolver::upsertExternalIdentity(
    const OrganizationId& organizationId,
    const UserId& userId,
    const std::string& provider,
    const std::string& providerUserId,
    const std::optional<std::string>& email)
{
    util::requireNonEmpty(organizationId, "organizationId");
    util::requireNonEmpty(userId, "userId");
    util::requireNonEmpty(provider, "provider");
    util::requireNonEmpty(providerUserId, "providerUserId");

    const auto now = m_clock();
    TransactionScope txn{m_store, TransactionMode::READ_WRITE};

    auto identity = txn->lockIdentity({organizationId, provider, providerUserId});
    if (!identity) {
        txn->insertIdentity(model::ExternalIdentity{
            .organizationId = organizationId,
            .userId = userId,
            .provider = provider,
            .providerUserId = providerUserId,
            .email = email,
            .createdAt = now,
            .updatedAt = now
        });
        txn.commit();
        return;
    }

    if (identity->userId != userId) {
        spdlog::warn(
            "Refusing to re-point {}/{} in organization {} from user {} to {}",
            provider,
            providerUserId,
            organizationId,
            identity->userId,
            userId);
    }
    if (email.has_value()) {
        identity->email = email;
    }
    identity->updatedAt = now;
    txn->updateIdentity(*identity);
    txn.commit();
}

//-------------------------------------------------------------------------

}  // namespace gemledger::ledger

//-------------------------------------------------------------------------
