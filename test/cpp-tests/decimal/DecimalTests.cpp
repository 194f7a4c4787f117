/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/decimal/decimal.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace cashdesk;
using namespace cashdesk::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct ParseDecimalCase
{
    std::string input;
    std::optional<decimal_t> expected;
};

void PrintTo(const ParseDecimalCase& c, std::ostream* os)
{
    *os << fmt::format("'{}'", c.input);
}

struct ParseDecimalTest : TestWithParam<ParseDecimalCase> {};

TEST_P(ParseDecimalTest, Parses)
{
    const auto& [input, expected] = GetParam();
    EXPECT_EQ(util::parseDecimal(input), expected);
}

INSTANTIATE_TEST_SUITE_P(
    Decimal,
    ParseDecimalTest,
    Values(
        ParseDecimalCase{"150", 150_dec},
        ParseDecimalCase{"12.50", DEC(12.50)},
        ParseDecimalCase{"-3.1", DEC(-3.1)},
        ParseDecimalCase{"0.005", DEC(0.005)},
        ParseDecimalCase{"abc", std::nullopt},
        ParseDecimalCase{"", std::nullopt},
        ParseDecimalCase{"nan", std::nullopt},
        ParseDecimalCase{"inf", std::nullopt}));

//-------------------------------------------------------------------------

TEST(Decimal, RoundsToPlaces)
{
    EXPECT_EQ(util::round(DEC(12.345)), DEC(12.35));
    EXPECT_EQ(util::round(DEC(12.344)), DEC(12.34));
    EXPECT_EQ(util::round(DEC(12.5), 0), 13_dec);
    EXPECT_EQ(util::round(DEC(1.23456789), 4), DEC(1.2346));
}

//-------------------------------------------------------------------------

TEST(Decimal, ClampsAtZero)
{
    EXPECT_EQ(util::clampNonNegative(DEC(-0.01)), 0_dec);
    EXPECT_EQ(util::clampNonNegative(DEC(7.25)), DEC(7.25));
    EXPECT_EQ(util::abs(DEC(-7.25)), DEC(7.25));
}

//-------------------------------------------------------------------------

TEST(Decimal, PackingIsLossless)
{
    for (decimal_t val : {DEC(0.01), DEC(-123456.78), 0_dec, DEC(99999999.99)}) {
        EXPECT_EQ(util::unpackDecimal(util::packDecimal(val)), val);
    }
}

//-------------------------------------------------------------------------

TEST(Decimal, Formats)
{
    EXPECT_EQ(fmt::format("{}", 0_dec), "0.0");
}

//-------------------------------------------------------------------------
