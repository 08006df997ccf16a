/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "firmquote/validator/FillableAmount.hpp"
#include "test-common/formatting.hpp"
#include "test-common/quotes.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace firmquote;
using namespace firmquote::validator;
using namespace firmquote::test;

using namespace testing;

//-------------------------------------------------------------------------

struct FillableAmountTestParams
{
    decimal_t makerAmount;
    decimal_t takerAmount;
    std::optional<EffectiveBalance> balance;
    decimal_t refAmount;
    FillStatus refStatus;
};

void PrintTo(const FillableAmountTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.makerAmount = {}, .takerAmount = {}, .balance = {}, .refAmount = {}, "
        ".refStatus = {}}}",
        params.makerAmount,
        params.takerAmount,
        params.balance ? fmt::format("{}", *params.balance) : std::string{"unknown"},
        params.refAmount,
        params.refStatus);
}

struct FillableAmountTest : TestWithParam<FillableAmountTestParams> {};

TEST_P(FillableAmountTest, WorksCorrectly)
{
    const auto& [makerAmount, takerAmount, balance, refAmount, refStatus] = GetParam();
    const auto quote = makeQuote(kMakerA, kTokenX, makerAmount, takerAmount);
    const FillResult result = computeFillableAmount(quote, balance);
    EXPECT_EQ(result.amount, refAmount);
    EXPECT_EQ(result.status, refStatus);
    EXPECT_LE(result.amount, takerAmount);
}

INSTANTIATE_TEST_SUITE_P(
    FillableAmountTests,
    FillableAmountTest,
    Values(
        FillableAmountTestParams{
            .makerAmount = DEC(100),
            .takerAmount = DEC(50),
            .balance = std::nullopt,
            .refAmount = DEC(50),
            .refStatus = FillStatus::UNKNOWN_MAKER
        },
        FillableAmountTestParams{
            .makerAmount = DEC(100),
            .takerAmount = DEC(50),
            .balance = Unconstrained{},
            .refAmount = DEC(50),
            .refStatus = FillStatus::FULLY_FILLABLE
        },
        FillableAmountTestParams{
            .makerAmount = DEC(100),
            .takerAmount = DEC(50),
            .balance = DEC(100),
            .refAmount = DEC(50),
            .refStatus = FillStatus::FULLY_FILLABLE
        },
        FillableAmountTestParams{
            .makerAmount = DEC(100),
            .takerAmount = DEC(50),
            .balance = DEC(1000000),
            .refAmount = DEC(50),
            .refStatus = FillStatus::FULLY_FILLABLE
        },
        FillableAmountTestParams{
            .makerAmount = DEC(100),
            .takerAmount = DEC(50),
            .balance = DEC(40),
            .refAmount = DEC(20),
            .refStatus = FillStatus::PARTIALLY_FILLABLE
        },
        FillableAmountTestParams{
            .makerAmount = DEC(3),
            .takerAmount = DEC(10),
            .balance = DEC(1),
            .refAmount = DEC(3),
            .refStatus = FillStatus::PARTIALLY_FILLABLE
        },
        FillableAmountTestParams{
            .makerAmount = DEC(100),
            .takerAmount = DEC(1),
            .balance = DEC(99.99),
            .refAmount = DEC(0),
            .refStatus = FillStatus::PARTIALLY_FILLABLE
        },
        FillableAmountTestParams{
            .makerAmount = DEC(100),
            .takerAmount = DEC(50),
            .balance = DEC(0),
            .refAmount = DEC(0),
            .refStatus = FillStatus::PARTIALLY_FILLABLE
        },
        FillableAmountTestParams{
            .makerAmount = DEC(1000000000000000000000),
            .takerAmount = DEC(3000000000000000000000),
            .balance = DEC(333333333333333333333.3),
            .refAmount = DEC(999999999999999999999),
            .refStatus = FillStatus::PARTIALLY_FILLABLE
        },
        FillableAmountTestParams{
            .makerAmount = DEC(0),
            .takerAmount = DEC(50),
            .balance = DEC(0),
            .refAmount = DEC(50),
            .refStatus = FillStatus::FULLY_FILLABLE
        },
        FillableAmountTestParams{
            .makerAmount = DEC(0),
            .takerAmount = DEC(50),
            .balance = decimal_t{-1},
            .refAmount = DEC(0),
            .refStatus = FillStatus::DEGENERATE_ORDER
        },
        FillableAmountTestParams{
            .makerAmount = DEC(100),
            .takerAmount = DEC(50),
            .balance = decimal_t{-40},
            .refAmount = DEC(0),
            .refStatus = FillStatus::ARITHMETIC_INCONSISTENCY
        }
    ));

//-------------------------------------------------------------------------
