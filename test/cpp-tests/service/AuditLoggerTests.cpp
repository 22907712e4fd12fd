/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LedgerFixture.hpp"
#include "gemledger/service/AuditLogger.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace gemledger;
using namespace gemledger::test;
using namespace std::chrono_literals;
using namespace testing;

//-------------------------------------------------------------------------

struct AuditLoggerTest : public LedgerFixture
{
    void SetUp() override
    {
        fs::remove(path);
        audit = std::make_unique<service::AuditLogger>(path, signals);
    }

    void TearDown() override
    {
        audit.reset();
        fs::remove(path);
    }

    std::vector<std::string> lines() const
    {
        std::vector<std::string> result;
        std::ifstream in{path};
        for (std::string line; std::getline(in, line);) {
            result.push_back(line);
        }
        return result;
    }

    const fs::path path{fs::temp_directory_path() / "gemledger-audit-test.csv"};
    std::unique_ptr<service::AuditLogger> audit;
};

//-------------------------------------------------------------------------

TEST_F(AuditLoggerTest, StartsWithHeader)
{
    EXPECT_THAT(
        lines(),
        ElementsAre("time,event,organizationId,walletId,recordId,state,amount,detail"));
}

TEST_F(AuditLoggerTest, RecordsCommittedEvents)
{
    const auto wallet = makeWallet("alice");
    const auto ms = toEpochMillis(time.now);

    const auto entry = credit(wallet.id, 500, "k1");
    const auto receipt = holds.createHold(kOrg, wallet.id, "shop", "order-1", 200, 15min);
    time.advance(1s);
    (void) holds.releaseHold(kOrg, receipt.holdId);
    (void) wallets.setStatus(kOrg, wallet.id, model::WalletStatus::FROZEN);

    EXPECT_THAT(
        lines(),
        ElementsAre(
            _,
            fmt::format("{},wallet_created,org-1,{},alice,active,,GEMS", ms, wallet.id),
            fmt::format(
                "{},entry,org-1,{},{},credit,500,"
                R"("purchase key=k1 {{""type"":""purchase"",""provider"":""stripe"",""orderId"":""purchase-k1""}}")",
                ms,
                wallet.id,
                entry.id),
            fmt::format(
                "{},hold,org-1,{},{},active,200,shop/order-1 expires={}",
                ms,
                wallet.id,
                receipt.holdId,
                toEpochMillis(receipt.expiresAt)),
            fmt::format(
                "{},hold,org-1,{},{},released,200,shop/order-1 expires={}",
                ms + 1000,
                wallet.id,
                receipt.holdId,
                toEpochMillis(receipt.expiresAt)),
            fmt::format("{},wallet_status,org-1,{},alice,frozen,,GEMS", ms + 1000, wallet.id)));
}

TEST_F(AuditLoggerTest, ReplaysAreNotRecorded)
{
    const auto wallet = makeWallet();
    credit(wallet.id, 500, "k1");
    credit(wallet.id, 500, "k1");
    (void) makeWallet();

    EXPECT_THAT(lines(), SizeIs(3));
}

TEST_F(AuditLoggerTest, StopsListeningWhenDestroyed)
{
    audit.reset();
    const auto wallet = makeWallet();
    credit(wallet.id, 500, "k1");

    EXPECT_THAT(lines(), SizeIs(1));
}

//-------------------------------------------------------------------------
