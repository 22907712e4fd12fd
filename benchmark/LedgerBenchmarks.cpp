/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "gemledger/ledger/BalanceCalculator.hpp"
#include "gemledger/ledger/HoldEngine.hpp"
#include "gemledger/ledger/LedgerLog.hpp"
#include "gemledger/ledger/WalletDirectory.hpp"
#include "gemledger/store/MemoryStore.hpp"

#include <limits>

//-------------------------------------------------------------------------

using namespace gemledger;

static const OrganizationId kOrg{"bench-org"};

//-------------------------------------------------------------------------

struct LedgerFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        const auto walletCount = state.range(0);

        store = std::make_unique<store::MemoryStore>();
        wallets = std::make_unique<ledger::WalletDirectory>(*store, signals);
        log = std::make_unique<ledger::LedgerLog>(*store, signals);
        balances = std::make_unique<ledger::BalanceCalculator>(*store);
        holds = std::make_unique<ledger::HoldEngine>(*store, *log, signals);

        walletIds.clear();
        for (int64_t i = 0; i < walletCount; ++i) {
            walletIds.push_back(wallets->ensureWallet(kOrg, fmt::format("user-{}", i)).id);
        }
        sequence = 0;
    }

    void TearDown(benchmark::State&) override
    {
        holds.reset();
        balances.reset();
        log.reset();
        wallets.reset();
        store.reset();
    }

    const WalletId& nextWallet() { return walletIds[sequence % walletIds.size()]; }

    ledger::EntryInsertion topUp(const WalletId& walletId, MinorUnits amount)
    {
        const auto key = fmt::format("topup-{}", sequence++);
        return log->insertLedgerEntry(
            kOrg,
            walletId,
            model::Direction::CREDIT,
            amount,
            model::EntryReason::PURCHASE,
            model::PurchaseReference{.provider = "bench", .orderId = key},
            key);
    }

    ledger::LedgerSignals signals;
    std::unique_ptr<store::MemoryStore> store;
    std::unique_ptr<ledger::WalletDirectory> wallets;
    std::unique_ptr<ledger::LedgerLog> log;
    std::unique_ptr<ledger::BalanceCalculator> balances;
    std::unique_ptr<ledger::HoldEngine> holds;
    std::vector<WalletId> walletIds;
    size_t sequence{};
};

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(LedgerFixture, Credit)(benchmark::State& state)
{
    for (auto _ : state) {
        benchmark::DoNotOptimize(topUp(nextWallet(), 100));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(LedgerFixture, Credit)->Arg(1)->Arg(64);

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(LedgerFixture, CreateHold)(benchmark::State& state)
{
    for (const auto& walletId : walletIds) {
        topUp(walletId, std::numeric_limits<int32_t>::max());
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(holds->createHold(
            kOrg,
            nextWallet(),
            "bench",
            fmt::format("order-{}", sequence++),
            1,
            std::chrono::minutes{15}));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(LedgerFixture, CreateHold)->Arg(1)->Arg(64);

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(LedgerFixture, HoldThenCapture)(benchmark::State& state)
{
    for (const auto& walletId : walletIds) {
        topUp(walletId, std::numeric_limits<int32_t>::max());
    }
    for (auto _ : state) {
        const auto& walletId = nextWallet();
        const auto orderId = fmt::format("order-{}", sequence++);
        const auto receipt =
            holds->createHold(kOrg, walletId, "bench", orderId, 1, std::chrono::minutes{15});
        benchmark::DoNotOptimize(holds->captureHold(kOrg, receipt.holdId, "capture-" + orderId));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(LedgerFixture, HoldThenCapture)->Arg(1)->Arg(64);

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(LedgerFixture, GetBalances)(benchmark::State& state)
{
    for (const auto& walletId : walletIds) {
        for (int i = 0; i < 100; ++i) {
            topUp(walletId, 100);
        }
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(balances->getBalances(kOrg, nextWallet()));
        ++sequence;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(LedgerFixture, GetBalances)->Arg(1)->Arg(64);

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    spdlog::set_level(spdlog::level::warn);
    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
}

//-------------------------------------------------------------------------
