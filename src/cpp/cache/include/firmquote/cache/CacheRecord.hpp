/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace firmquote::cache
{

//-------------------------------------------------------------------------

struct CacheKey
{
    Address tokenAddress;
    Address makerAddress;

    auto operator<=>(const CacheKey&) const = default;
};

//-------------------------------------------------------------------------

struct CacheRecord
{
    Address tokenAddress;
    Address makerAddress;
    std::optional<decimal_t> balance;
    std::optional<Timestamp> timeFirstSeen;
    std::optional<Timestamp> timeOfSample;

    [[nodiscard]] CacheKey key() const { return {tokenAddress, makerAddress}; }
};

//-------------------------------------------------------------------------

// A maker/token pair registered for sampling.
struct BackfillEntry
{
    Address tokenAddress;
    Address makerAddress;
    Timestamp timeFirstSeen;
};

//-------------------------------------------------------------------------

}  // namespace firmquote::cache

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<firmquote::cache::CacheRecord>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const firmquote::cache::CacheRecord& record, FormatContext& ctx) const
    {
        auto opt = [](const auto& val) {
            return val.has_value() ? fmt::format("{}", *val) : std::string{"null"};
        };
        return fmt::format_to(
            ctx.out(),
            "{{token = {}, maker = {}, balance = {}, timeFirstSeen = {}, timeOfSample = {}}}",
            record.tokenAddress,
            record.makerAddress,
            opt(record.balance),
            opt(record.timeFirstSeen),
            opt(record.timeOfSample));
    }
};

//-------------------------------------------------------------------------
