/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "gemledger/ledger/LedgerSignals.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace gemledger::service
{

//-------------------------------------------------------------------------
// One CSV line per committed ledger event.

class AuditLogger
{
public:
    AuditLogger(const fs::path& filepath, ledger::LedgerSignals& signals);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void log(const model::Wallet& wallet, std::string_view event) const;
    void log(const model::LedgerEntry& entry) const;
    void log(const model::Hold& hold) const;

private:
    void write(
        Timestamp time,
        std::string_view event,
        const OrganizationId& organizationId,
        const WalletId& walletId,
        const std::string& recordId,
        std::string_view state,
        std::optional<MinorUnits> amount,
        const std::string& detail) const;

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    std::vector<bs2::scoped_connection> m_feeds;
};

//-------------------------------------------------------------------------

}  // namespace gemledger::service

//-------------------------------------------------------------------------
