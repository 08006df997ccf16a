/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace firmquote::validator
{

//-------------------------------------------------------------------------

enum class AnomalyKind : uint32_t
{
    BATCH_HETEROGENEITY,
    CACHE_ANOMALY,
    SAMPLER_STUCK,
    ARITHMETIC_INCONSISTENCY,
    BACKFILL_FAILURE
};

struct AnomalyEvent
{
    Timestamp timestamp;
    AnomalyKind kind;
    Address tokenAddress;
    Address makerAddress;
    std::string message;
};

struct BackfillEvent
{
    Timestamp timestamp;
    Address tokenAddress;
    std::vector<Address> makerAddresses;
    size_t inserted;
};

//-------------------------------------------------------------------------

// Connected slots run on the validating thread.
struct ValidatorSignals
{
    bs2::signal<void(const AnomalyEvent&)> anomaly;
    bs2::signal<void(const BackfillEvent&)> backfill;
};

//-------------------------------------------------------------------------

}  // namespace firmquote::validator

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<firmquote::validator::AnomalyKind>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(firmquote::validator::AnomalyKind kind, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(kind));
    }
};

//-------------------------------------------------------------------------
