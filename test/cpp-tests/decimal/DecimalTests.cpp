/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "firmquote/decimal/decimal.hpp"
#include "test-common/formatting.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace firmquote;
using namespace firmquote::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct ParseDecimalTestParams
{
    std::string_view str;
    decimal_t refValue;
};

void PrintTo(const ParseDecimalTestParams& params, std::ostream* os)
{
    *os << fmt::format("{{.str = {}, .refValue = {}}}", params.str, params.refValue);
}

struct ParseDecimalTest : TestWithParam<ParseDecimalTestParams> {};

TEST_P(ParseDecimalTest, WorksCorrectly)
{
    const auto& [str, refValue] = GetParam();
    const auto parsed = util::tryParseDecimal(str);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, refValue);
}

INSTANTIATE_TEST_SUITE_P(
    DecimalTests,
    ParseDecimalTest,
    Values(
        ParseDecimalTestParams{.str = "0", .refValue = 0_dec},
        ParseDecimalTestParams{.str = "42", .refValue = 42_dec},
        ParseDecimalTestParams{.str = "-7", .refValue = decimal_t{-7}},
        ParseDecimalTestParams{.str = "+3", .refValue = 3_dec},
        ParseDecimalTestParams{.str = "0.5", .refValue = decimal_t{1} / 2},
        ParseDecimalTestParams{.str = ".25", .refValue = decimal_t{1} / 4},
        ParseDecimalTestParams{.str = "12.", .refValue = 12_dec},
        ParseDecimalTestParams{.str = "1e3", .refValue = 1000_dec},
        ParseDecimalTestParams{.str = "1.5E-2", .refValue = decimal_t{3} / 200},
        ParseDecimalTestParams{
            .str = "123456789012345678901234567890",
            .refValue = decimal_t{integer_t{"123456789012345678901234567890"}}
        }
    ));

//-------------------------------------------------------------------------

struct MalformedDecimalTest : TestWithParam<std::string_view> {};

TEST_P(MalformedDecimalTest, IsRejected)
{
    EXPECT_FALSE(util::tryParseDecimal(GetParam()).has_value());
    EXPECT_THROW((void)util::parseDecimal(GetParam()), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    DecimalTests,
    MalformedDecimalTest,
    Values("", "-", ".", "abc", "1.2.3", "1e", "1e+", "1e12345", "0x10", " 1"));

//-------------------------------------------------------------------------

TEST(DecimalTest, TruncRoundsTowardZero)
{
    EXPECT_EQ(util::trunc(decimal_t{7} / 2), 3_dec);
    EXPECT_EQ(util::trunc(decimal_t{-7} / 2), decimal_t{-3});
    EXPECT_EQ(util::trunc(decimal_t{2} / 3), 0_dec);
    EXPECT_EQ(util::trunc(5_dec), 5_dec);
}

//-------------------------------------------------------------------------

TEST(DecimalTest, IsIntegral)
{
    EXPECT_TRUE(util::isIntegral(DEC(20)));
    EXPECT_TRUE(util::isIntegral(DEC(2.0)));
    EXPECT_FALSE(util::isIntegral(DEC(2.5)));
}

//-------------------------------------------------------------------------

TEST(DecimalTest, Formatting)
{
    EXPECT_EQ(fmt::format("{}", DEC(20)), "20");
    EXPECT_EQ(fmt::format("{}", DEC(0.05)), "0.05");
    EXPECT_EQ(fmt::format("{}", DEC(-12.5)), "-12.5");
    EXPECT_EQ(fmt::format("{}", DEC(1.5e-3)), "0.0015");
    EXPECT_EQ(fmt::format("{}", decimal_t{decimal_t{1} / 3}), "1/3");
    EXPECT_EQ(fmt::format("{}", decimal_t{decimal_t{-2} / 3}), "-2/3");
}

//-------------------------------------------------------------------------
