/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "firmquote/cache/CacheRecord.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace firmquote::validator
{

//-------------------------------------------------------------------------

// Balance of a maker that may fill any quote it makes.
struct Unconstrained
{
    bool operator==(const Unconstrained&) const = default;
};

using EffectiveBalance = std::variant<Unconstrained, decimal_t>;

//-------------------------------------------------------------------------

enum class Classification : uint32_t
{
    FRESH,
    RECENTLY_REGISTERED,
    UNSAMPLED_STUCK,
    STALE_SAMPLE,
    NULL_BALANCE
};

//-------------------------------------------------------------------------

struct ClassificationInfo
{
    Address tokenAddress;
    Address makerAddress;
    std::optional<decimal_t> balance;
    // timeOfSample if sampled, timeFirstSeen (epoch if unset) otherwise.
    Timestamp reference;
    Timestamp age;
    Timestamp threshold;
    Classification status;

    [[nodiscard]] bool isAnomaly() const noexcept;
    [[nodiscard]] EffectiveBalance effectiveBalance() const;
    [[nodiscard]] std::string toString() const;
};

[[nodiscard]] ClassificationInfo classify(
    const cache::CacheRecord& record, Timestamp now, Timestamp threshold);

//-------------------------------------------------------------------------

}  // namespace firmquote::validator

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<firmquote::validator::Classification>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(firmquote::validator::Classification status, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(status));
    }
};

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<firmquote::validator::EffectiveBalance>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const firmquote::validator::EffectiveBalance& balance, FormatContext& ctx) const
    {
        if (const auto* amount = std::get_if<firmquote::decimal_t>(&balance)) {
            return fmt::format_to(ctx.out(), "{}", *amount);
        }
        return fmt::format_to(ctx.out(), "unconstrained");
    }
};

//-------------------------------------------------------------------------
