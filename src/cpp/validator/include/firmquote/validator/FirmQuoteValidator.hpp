/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "firmquote/cache/ICacheRepository.hpp"
#include "firmquote/quote/Quote.hpp"
#include "firmquote/validator/Classification.hpp"
#include "firmquote/validator/ValidatorConfig.hpp"
#include "firmquote/validator/ValidatorSignals.hpp"
#include "common.hpp"
#include "util.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace firmquote::validator
{

//-------------------------------------------------------------------------

/**
 * Caps the taker-fillable amount of each quote in a batch by the maker's
 * cached balance of the offered token.
 *
 * All quotes of a batch must offer the same maker token; mixed batches are
 * denied as a whole. Makers with no cache record at all are granted the full
 * taker amount and registered in the cache for sampling. Makers whose record
 * is registered but not yet sampled are granted the full amount until the
 * staleness threshold passes; stale or inconsistent records deny the fill.
 *
 * Instances hold no per-call state and may be shared by concurrent callers.
 */
class FirmQuoteValidator
{
public:
    FirmQuoteValidator(
        cache::ICacheRepository::Ptr repository,
        ValidatorConfig config,
        ClockFn clock = util::currentTimestamp,
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * Returns one fillable taker amount per quote, in input order.
     *
     * Throws cache::CacheRepositoryException if the cache cannot be read.
     * Failing to register unknown makers is logged and does not throw.
     */
    [[nodiscard]] std::vector<decimal_t> computeFillableAmounts(
        std::span<const quote::Quote> quotes) const;

    [[nodiscard]] const ValidatorConfig& config() const noexcept { return m_config; }
    [[nodiscard]] ValidatorSignals& signals() const noexcept { return m_signals; }

private:
    using BalanceLookup = std::map<Address, EffectiveBalance>;

    [[nodiscard]] std::optional<Address> resolveMakerToken(
        std::span<const quote::Quote> quotes) const;
    [[nodiscard]] BalanceLookup buildBalanceLookup(
        const Address& tokenAddress, std::span<const quote::Quote> quotes, Timestamp now) const;
    void backfill(
        const Address& tokenAddress, const std::set<Address>& makerAddresses, Timestamp now) const;
    void reportAnomaly(
        AnomalyKind kind,
        const Address& tokenAddress,
        const Address& makerAddress,
        std::string message,
        Timestamp now) const;

    cache::ICacheRepository::Ptr m_repository;
    ValidatorConfig m_config;
    ClockFn m_clock;
    std::shared_ptr<spdlog::logger> m_logger;
    mutable ValidatorSignals m_signals;
};

//-------------------------------------------------------------------------

}  // namespace firmquote::validator

//-------------------------------------------------------------------------
