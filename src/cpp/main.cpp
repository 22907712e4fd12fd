/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/ledger/BalanceCalculator.hpp"
#include "gemledger/ledger/HoldEngine.hpp"
#include "gemledger/ledger/LedgerLog.hpp"
#include "gemledger/money/MoneyCodec.hpp"
#include "gemledger/service/AuditLogger.hpp"
#include "gemledger/service/ServiceConfig.hpp"
#include "gemledger/store/MemoryStore.hpp"
#include "common.hpp"

#include <CLI/CLI.hpp>

//-------------------------------------------------------------------------

using namespace gemledger;

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"gemledger v1.0"};

    fs::path configFile;
    app.add_option("-f,--config-file", configFile, "Ledger config file")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path checkpointFile;
    app.add_option("-c,--checkpoint-file", checkpointFile, "Checkpoint file");

    auto sweepCmd = app.add_subcommand("sweep", "Expire overdue holds and save the checkpoint");

    OrganizationId organizationId;
    WalletId walletId;

    auto balanceCmd = app.add_subcommand("balance", "Print the balances of a wallet");
    balanceCmd->add_option("--org", organizationId, "Organization id")->required();
    balanceCmd->add_option("--wallet", walletId, "Wallet id")->required();

    auto historyCmd = app.add_subcommand("history", "Print the ledger entries of a wallet");
    historyCmd->add_option("--org", organizationId, "Organization id")->required();
    historyCmd->add_option("--wallet", walletId, "Wallet id")->required();

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    fmt::println("{}", app.get_description());

    const auto config = service::ServiceConfig::fromFile(configFile);
    if (checkpointFile.empty()) {
        checkpointFile = config.store().checkpointFile;
    }

    const store::MemoryStore::Parameters storeParams{.lockTimeout = config.store().lockTimeout};
    auto store = fs::exists(checkpointFile)
        ? store::MemoryStore::fromCheckpoint(checkpointFile, storeParams)
        : std::make_unique<store::MemoryStore>(storeParams);

    ledger::LedgerSignals signals;
    const money::MoneyCodec codec{config.currency().decimals};

    if (*sweepCmd) {
        service::AuditLogger audit{config.audit().file, signals};
        ledger::LedgerLog log{*store, signals};
        ledger::HoldEngine holds{*store, log, signals};
        const auto expired = holds.expireHolds(config.holds().sweepBatchSize);
        store->saveCheckpoint(checkpointFile);
        fmt::println(" - expired {} holds", expired);
    }
    else if (*balanceCmd) {
        ledger::BalanceCalculator calculator{*store};
        const auto balances = calculator.getBalances(organizationId, walletId);
        fmt::println("available: {} ({} {})",
            balances.available, codec.toDecimalString(balances.available), kCurrencyCode);
        fmt::println("on hold:   {} ({} {})",
            balances.onHold, codec.toDecimalString(balances.onHold), kCurrencyCode);
        fmt::println("balance:   {} ({} {})",
            balances.balance, codec.toDecimalString(balances.balance), kCurrencyCode);
    }
    else if (*historyCmd) {
        ledger::LedgerLog log{*store, signals};
        for (const auto& entry : log.history(organizationId, walletId)) {
            fmt::println("{} {} {}", toEpochMillis(entry.createdAt), entry, codec.toDecimalString(entry.signedAmount()));
        }
    }

    return 0;
}

//-------------------------------------------------------------------------
