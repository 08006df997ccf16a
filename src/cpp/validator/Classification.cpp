/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "firmquote/validator/Classification.hpp"

#include "util.hpp"

//-------------------------------------------------------------------------

namespace firmquote::validator
{

//-------------------------------------------------------------------------

bool ClassificationInfo::isAnomaly() const noexcept
{
    return status != Classification::FRESH && status != Classification::RECENTLY_REGISTERED;
}

//-------------------------------------------------------------------------

EffectiveBalance ClassificationInfo::effectiveBalance() const
{
    switch (status) {
        case Classification::FRESH:
            return balance.value();
        case Classification::RECENTLY_REGISTERED:
            return Unconstrained{};
        default:
            return 0_dec;
    }
}

//-------------------------------------------------------------------------

std::string ClassificationInfo::toString() const
{
    switch (status) {
        case Classification::FRESH:
            return fmt::format(
                "Cache entry for maker {} and token {} holds {} sampled {}ms ago",
                makerAddress, tokenAddress, balance.value(), age);
        case Classification::RECENTLY_REGISTERED:
            return fmt::format(
                "Cache entry for maker {} and token {} was registered {}ms ago and is not "
                "sampled yet; assuming the entire taker fillable amount is available",
                makerAddress, tokenAddress, age);
        case Classification::UNSAMPLED_STUCK:
            return fmt::format(
                "Cache entry for maker {} and token {} was first added at {} which is more "
                "than {}ms ago and never sampled; assuming the sampler is stuck",
                makerAddress, tokenAddress, reference, threshold);
        case Classification::STALE_SAMPLE:
            return fmt::format(
                "Cache entry for maker {} and token {} was last refreshed at {} which is more "
                "than {}ms ago; assuming the sampler is stuck",
                makerAddress, tokenAddress, reference, threshold);
        case Classification::NULL_BALANCE:
            return fmt::format(
                "Cache entry for maker {} and token {} was sampled at {} but has a null balance",
                makerAddress, tokenAddress, reference);
        default:
            return fmt::format("Unknown classification code {}", std::to_underlying(status));
    }
}

//-------------------------------------------------------------------------

ClassificationInfo classify(const cache::CacheRecord& record, Timestamp now, Timestamp threshold)
{
    ClassificationInfo info{
        .tokenAddress = record.tokenAddress,
        .makerAddress = record.makerAddress,
        .balance = record.balance,
        .reference = record.timeOfSample.value_or(record.timeFirstSeen.value_or(TIMESTAMP_EPOCH)),
        .threshold = threshold
    };
    info.age = util::elapsedSince(info.reference, now);

    if (!record.timeOfSample.has_value()) {
        info.status = info.age > threshold
            ? Classification::UNSAMPLED_STUCK
            : Classification::RECENTLY_REGISTERED;
    }
    else if (info.age > threshold) {
        info.status = Classification::STALE_SAMPLE;
    }
    else if (!record.balance.has_value()) {
        info.status = Classification::NULL_BALANCE;
    }
    else {
        info.status = Classification::FRESH;
    }

    return info;
}

//-------------------------------------------------------------------------

}  // namespace firmquote::validator

//-------------------------------------------------------------------------
