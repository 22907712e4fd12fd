/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "gemledger/store/Store.hpp"

//-------------------------------------------------------------------------

namespace gemledger::ledger
{

//-------------------------------------------------------------------------

class IdentityResolver
{
public:
    explicit IdentityResolver(store::Store& store, Clock clock = &systemNow);

    [[nodiscard]] std::optional<UserId> findUserIdByExternalIdentity(
        const OrganizationId& organizationId,
        const std::string& provider,
        const std::string& providerUserId);

    // A mapped key keeps its user; only a non-null email overwrites.
    void upsertExternalIdentity(
        const OrganizationId& organizationId,
        const UserId& userId,
        const std::string& provider,
        const std::string& providerUserId,
        const std::optional<std::string>& email = {});

private:
    store::Store& m_store;
    Clock m_clock;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::ledger

//-------------------------------------------------------------------------
