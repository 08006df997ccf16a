/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <pugixml.hpp>

#include <array>
#include <limits>

//-------------------------------------------------------------------------

namespace firmquote::validator
{

//-------------------------------------------------------------------------

enum class Timescale { s, ms, us, ns };

inline constexpr auto kTimescaleCount = magic_enum::enum_count<Timescale>();

// Units of each timescale per second.
inline constexpr std::array<Timestamp, kTimescaleCount> timescaleFactor{
    1,
    1'000,
    1'000'000,
    1'000'000'000
};

[[nodiscard]] inline constexpr auto timescaleToFactor(Timescale ts) noexcept
{
    return timescaleFactor.at(std::to_underlying(ts));
}

// Largest value of the timescale whose millisecond conversion fits a Timestamp.
[[nodiscard]] inline constexpr Timestamp maxConvertible(Timescale ts) noexcept
{
    const Timestamp factor = timescaleToFactor(ts);
    return factor >= 1'000
        ? std::numeric_limits<Timestamp>::max()
        : std::numeric_limits<Timestamp>::max() / (1'000 / factor);
}

// Truncates sub-millisecond remainders. Requires value <= maxConvertible(ts).
[[nodiscard]] inline constexpr Timestamp toMilliseconds(Timestamp value, Timescale ts) noexcept
{
    const Timestamp factor = timescaleToFactor(ts);
    return factor >= 1'000 ? value / (factor / 1'000) : value * (1'000 / factor);
}

//-------------------------------------------------------------------------

inline constexpr Timestamp kDefaultStalenessThreshold = 2 * 60 * 1'000;

struct ValidatorConfig
{
    // Milliseconds.
    Timestamp stalenessThreshold{kDefaultStalenessThreshold};

    [[nodiscard]] static ValidatorConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace firmquote::validator

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<firmquote::validator::Timescale>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(firmquote::validator::Timescale ts, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(ts));
    }
};

//-------------------------------------------------------------------------
