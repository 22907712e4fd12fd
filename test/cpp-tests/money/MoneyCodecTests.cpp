/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "gemledger/money/MoneyCodec.hpp"
#include "LedgerException.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

//-------------------------------------------------------------------------

using namespace gemledger;
using namespace gemledger::money;
using namespace testing;

//-------------------------------------------------------------------------

struct ToMinorUnitsTest : public TestWithParam<std::pair<std::string, MinorUnits>>
{
    MoneyCodec codec;
};

INSTANTIATE_TEST_SUITE_P(
    MoneyCodecTest,
    ToMinorUnitsTest,
    Values(
        std::pair{"0", 0},
        std::pair{"1", 100},
        std::pair{"1.5", 150},
        std::pair{"0.01", 1},
        std::pair{"-12.34", -1234},
        std::pair{"0.005", 1},
        std::pair{"-0.005", -1},
        std::pair{"0.004", 0},
        std::pair{"1.995", 200},
        std::pair{"2.675", 268},
        std::pair{"1.005", 101},
        std::pair{"123456.78", 12345678},
        std::pair{".5", 50},
        std::pair{"7.", 700}));

TEST_P(ToMinorUnitsTest, RoundsHalfAwayFromZero)
{
    const auto [amount, expected] = GetParam();
    EXPECT_EQ(codec.toMinorUnits(amount), expected);
}

//-------------------------------------------------------------------------

struct MalformedAmountTest : public TestWithParam<std::string>
{
    MoneyCodec codec;
};

INSTANTIATE_TEST_SUITE_P(
    MoneyCodecTest,
    MalformedAmountTest,
    Values("", "-", ".", "abc", "1.2.3", "1e5", "--1", "+1", " 1", "1,5", "nan", "inf"));

TEST_P(MalformedAmountTest, IsValidationError)
{
    EXPECT_THROW((void) codec.toMinorUnits(GetParam()), ValidationError);
}

//-------------------------------------------------------------------------

struct ToDecimalStringTest : public TestWithParam<std::pair<MinorUnits, std::string>>
{
    MoneyCodec codec;
};

INSTANTIATE_TEST_SUITE_P(
    MoneyCodecTest,
    ToDecimalStringTest,
    Values(
        std::pair{0, "0.00"},
        std::pair{1, "0.01"},
        std::pair{-1, "-0.01"},
        std::pair{150, "1.50"},
        std::pair{-1234, "-12.34"},
        std::pair{100000, "1000.00"}));

TEST_P(ToDecimalStringTest, ZeroPadsTheFraction)
{
    const auto [amount, expected] = GetParam();
    EXPECT_EQ(codec.toDecimalString(amount), expected);
}

//-------------------------------------------------------------------------

TEST(MoneyCodecTest, DecimalStringsSurviveTheRoundTrip)
{
    const MoneyCodec codec;
    for (const std::string amount : {"0.00", "0.01", "-0.01", "5.00", "19.99", "-250.40", "90071992547.40"}) {
        EXPECT_EQ(codec.toDecimalString(codec.toMinorUnits(amount)), amount);
    }
}

TEST(MoneyCodecTest, FormatsTheMostNegativeAmount)
{
    const MoneyCodec codec;
    EXPECT_EQ(
        codec.toDecimalString(std::numeric_limits<MinorUnits>::min()),
        "-92233720368547758.08");
}

TEST(MoneyCodecTest, HonoursConfiguredDecimals)
{
    const MoneyCodec codec{3};
    EXPECT_EQ(codec.factor(), 1000);
    EXPECT_EQ(codec.toMinorUnits("1.2345"), 1235);
    EXPECT_EQ(codec.toDecimalString(1235), "1.235");
}

TEST(MoneyCodecTest, RejectsUnsupportedDecimals)
{
    EXPECT_THROW(MoneyCodec{0}, std::invalid_argument);
    EXPECT_THROW(MoneyCodec{kMaxDecimals + 1}, std::invalid_argument);
}

TEST(MoneyCodecTest, RejectsAmountsBeyondRange)
{
    const MoneyCodec codec;
    EXPECT_THROW((void) codec.toMinorUnits("100000000000000000000"), ValidationError);
}

TEST(MoneyCodecTest, RejectsAmountsBeyondDecimalPrecision)
{
    const MoneyCodec codec;
    EXPECT_THROW((void) codec.toMinorUnits("12345678901234567.89"), ValidationError);
    EXPECT_THROW((void) codec.toMinorUnits("-0.00499999999999999999"), ValidationError);
    EXPECT_EQ(codec.toMinorUnits("12345678901234.56"), 1234567890123456);
    EXPECT_EQ(codec.toMinorUnits("-0012345678901234.56"), -1234567890123456);
    EXPECT_EQ(codec.toMinorUnits("1.50000000000000000000"), 150);
    EXPECT_EQ(codec.toMinorUnits("0.000000000000000000001"), 0);
}

//-------------------------------------------------------------------------
