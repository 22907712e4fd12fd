/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/service/AuditLogger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace gemledger::service
{

//-------------------------------------------------------------------------

namespace
{

std::string csvField(std::string_view value)
{
    if (value.find_first_of(",\"\n") == std::string_view::npos) {
        return std::string{value};
    }
    std::string quoted{"\""};
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}  // namespace

//-------------------------------------------------------------------------

AuditLogger::AuditLogger(const fs::path& filepath, ledger::LedgerSignals& signals)
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "AuditLogger", std::make_shared<spdlog::sinks::basic_file_sink_mt>(m_filepath));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    m_feeds.emplace_back(signals.walletCreated.connect(
        [this](const model::Wallet& wallet) { log(wallet, "wallet_created"); }));
    m_feeds.emplace_back(signals.walletStatusChanged.connect(
        [this](const model::Wallet& wallet) { log(wallet, "wallet_status"); }));
    m_feeds.emplace_back(signals.entryAppended.connect(
        [this](const model::LedgerEntry& entry) { log(entry); }));
    m_feeds.emplace_back(signals.holdTransitioned.connect(
        [this](const model::Hold& hold) { log(hold); }));

    m_logger->trace("time,event,organizationId,walletId,recordId,state,amount,detail");
    m_logger->flush();
}

//-------------------------------------------------------------------------

void AuditLogger::log(const model::Wallet& wallet, std::string_view event) const
{
    write(
        wallet.updatedAt,
        event,
        wallet.organizationId,
        wallet.id,
        wallet.userId,
        util::enumName(wallet.status),
        std::nullopt,
        wallet.currency);
}

//-------------------------------------------------------------------------

void AuditLogger::log(const model::LedgerEntry& entry) const
{
    write(
        entry.createdAt,
        "entry",
        entry.organizationId,
        entry.walletId,
        entry.id,
        util::enumName(entry.direction),
        entry.amount,
        fmt::format(
            "{} key={} {}",
            entry.reason,
            entry.idempotencyKey,
            model::referenceToString(entry.reference)));
}

//-------------------------------------------------------------------------

void AuditLogger::log(const model::Hold& hold) const
{
    write(
        hold.updatedAt,
        "hold",
        hold.organizationId,
        hold.walletId,
        hold.id,
        util::enumName(hold.status),
        hold.amount,
        fmt::format("{}/{} expires={}", hold.provider, hold.orderId, toEpochMillis(hold.expiresAt)));
}

//-------------------------------------------------------------------------

void AuditLogger::write(
    Timestamp time,
    std::string_view event,
    const OrganizationId& organizationId,
    const WalletId& walletId,
    const std::string& recordId,
    std::string_view state,
    std::optional<MinorUnits> amount,
    const std::string& detail) const
{
    m_logger->trace(
        "{},{},{},{},{},{},{},{}",
        toEpochMillis(time),
        event,
        csvField(organizationId),
        csvField(walletId),
        csvField(recordId),
        state,
        amount ? fmt::format("{}", *amount) : std::string{},
        csvField(detail));
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace gemledger::service

//-------------------------------------------------------------------------
