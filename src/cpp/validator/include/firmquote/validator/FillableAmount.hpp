/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "firmquote/quote/Quote.hpp"
#include "firmquote/validator/Classification.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace firmquote::validator
{

//-------------------------------------------------------------------------

enum class FillStatus : uint32_t
{
    UNKNOWN_MAKER,
    FULLY_FILLABLE,
    DEGENERATE_ORDER,
    PARTIALLY_FILLABLE,
    ARITHMETIC_INCONSISTENCY
};

struct FillResult
{
    decimal_t amount;
    FillStatus status;
};

// An absent balance means the maker has no cache record at all.
[[nodiscard]] FillResult computeFillableAmount(
    const quote::Quote& quote, const std::optional<EffectiveBalance>& balance);

//-------------------------------------------------------------------------

}  // namespace firmquote::validator

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<firmquote::validator::FillStatus>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(firmquote::validator::FillStatus status, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(status));
    }
};

//-------------------------------------------------------------------------
