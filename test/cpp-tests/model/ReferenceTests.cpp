/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/model/Reference.hpp"
#include "json_util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace gemledger;
using namespace gemledger::model;
using namespace testing;

//-------------------------------------------------------------------------

TEST(ReferenceTest, ReasonFollowsTheAlternative)
{
    EXPECT_EQ(reasonOf(PurchaseReference{"stripe", "o1"}), EntryReason::PURCHASE);
    EXPECT_EQ(reasonOf(CaptureReference{"shop", "o1", "h1"}), EntryReason::CAPTURE);
    EXPECT_EQ(reasonOf(AdjustmentReference{"support", "goodwill"}), EntryReason::MANUAL_ADJUSTMENT);
    EXPECT_EQ(reasonOf(RefundReference{"shop", "o1", std::nullopt}), EntryReason::REFUND);
}

TEST(ReferenceTest, SerializesWithTypeTag)
{
    rapidjson::Document json;
    serializeReference(json, CaptureReference{"shop", "o1", "h1"});

    EXPECT_EQ(json::getString(json, "type"), "capture");
    EXPECT_EQ(json::getString(json, "provider"), "shop");
    EXPECT_EQ(json::getString(json, "orderId"), "o1");
    EXPECT_EQ(json::getString(json, "holdId"), "h1");
}

TEST(ReferenceTest, RefundNoteMayBeAbsent)
{
    const Reference withoutNote = RefundReference{"shop", "o1", std::nullopt};
    const Reference withNote = RefundReference{"shop", "o1", "damaged"};

    rapidjson::Document json;
    serializeReference(json, withoutNote);
    EXPECT_TRUE(json["note"].IsNull());
    EXPECT_EQ(referenceFromJson(json), withoutNote);

    rapidjson::Document noted;
    serializeReference(noted, withNote);
    EXPECT_EQ(referenceFromJson(noted), withNote);
}

TEST(ReferenceTest, UnknownTypeIsRejected)
{
    const auto json = json::str2json(R"({"type": "transfer", "provider": "x"})");
    EXPECT_THROW((void) referenceFromJson(json), ValidationError);
}

TEST(ReferenceTest, StringFormIsCompactJson)
{
    EXPECT_EQ(
        referenceToString(PurchaseReference{"stripe", "o-9"}),
        R"({"type":"purchase","provider":"stripe","orderId":"o-9"})");
}

//-------------------------------------------------------------------------
