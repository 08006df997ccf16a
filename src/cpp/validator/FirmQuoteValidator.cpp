/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "firmquote/validator/FirmQuoteValidator.hpp"

#include "firmquote/validator/FillableAmount.hpp"
#include "ValidatorException.hpp"

//-------------------------------------------------------------------------

namespace firmquote::validator
{

//-------------------------------------------------------------------------

FirmQuoteValidator::FirmQuoteValidator(
    cache::ICacheRepository::Ptr repository,
    ValidatorConfig config,
    ClockFn clock,
    std::shared_ptr<spdlog::logger> logger)
    : m_repository{std::move(repository)},
      m_config{config},
      m_clock{std::move(clock)},
      m_logger{std::move(logger)}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_repository == nullptr) {
        throw ValidatorException{fmt::format("{}: cache repository must not be null", ctx)};
    }
    if (!m_clock) {
        throw ValidatorException{fmt::format("{}: clock must be callable", ctx)};
    }
    if (m_logger == nullptr) {
        throw ValidatorException{fmt::format("{}: logger must not be null", ctx)};
    }
}

//-------------------------------------------------------------------------

std::vector<decimal_t> FirmQuoteValidator::computeFillableAmounts(
    std::span<const quote::Quote> quotes) const
{
    if (quotes.empty()) {
        return {};
    }

    const auto tokenAddress = resolveMakerToken(quotes);
    if (!tokenAddress.has_value()) {
        return std::vector<decimal_t>(quotes.size(), 0_dec);
    }

    const Timestamp now = m_clock();
    const BalanceLookup lookup = buildBalanceLookup(*tokenAddress, quotes, now);

    std::vector<decimal_t> amounts;
    amounts.reserve(quotes.size());
    std::set<Address> unknownMakers;

    for (const auto& quote : quotes) {
        const auto it = lookup.find(quote.makerAddress());
        const auto balance = it != lookup.end()
            ? std::make_optional(it->second)
            : std::optional<EffectiveBalance>{};
        FillResult result = computeFillableAmount(quote, balance);

        if (result.status == FillStatus::UNKNOWN_MAKER) {
            unknownMakers.insert(quote.makerAddress());
        }
        else if (result.status == FillStatus::ARITHMETIC_INCONSISTENCY) {
            reportAnomaly(
                AnomalyKind::ARITHMETIC_INCONSISTENCY,
                *tokenAddress,
                quote.makerAddress(),
                fmt::format(
                    "Partial fillable amount of quote {} against maker balance {} is not a "
                    "valid amount; denying the fill",
                    quote, *balance),
                now);
        }
        amounts.push_back(std::move(result.amount));
    }

    if (!unknownMakers.empty()) {
        backfill(*tokenAddress, unknownMakers, now);
    }

    m_logger->debug(
        "Validated {} quotes for token {} against {} cache entries",
        quotes.size(), *tokenAddress, lookup.size());

    return amounts;
}

//-------------------------------------------------------------------------

std::optional<Address> FirmQuoteValidator::resolveMakerToken(
    std::span<const quote::Quote> quotes) const
{
    const auto tokenAddresses = quotes
        | views::transform(&quote::Quote::makerAssetAddress)
        | ranges::to<std::set<Address>>();

    if (tokenAddresses.size() == 1) {
        return *tokenAddresses.begin();
    }

    reportAnomaly(
        AnomalyKind::BATCH_HETEROGENEITY,
        {},
        {},
        fmt::format(
            "Found multiple maker token addresses within one batch: [{}]. Rejecting the batch",
            fmt::join(tokenAddresses, ", ")),
        m_clock());
    return std::nullopt;
}

//-------------------------------------------------------------------------

FirmQuoteValidator::BalanceLookup FirmQuoteValidator::buildBalanceLookup(
    const Address& tokenAddress, std::span<const quote::Quote> quotes, Timestamp now) const
{
    const auto makerAddresses = quotes
        | views::transform(&quote::Quote::makerAddress)
        | ranges::to<std::set<Address>>();

    const auto records = m_repository->find(tokenAddress, makerAddresses);

    BalanceLookup lookup;
    for (const auto& record : records) {
        const ClassificationInfo info = classify(record, now, m_config.stalenessThreshold);
        if (info.isAnomaly()) {
            reportAnomaly(
                info.status == Classification::NULL_BALANCE
                    ? AnomalyKind::CACHE_ANOMALY
                    : AnomalyKind::SAMPLER_STUCK,
                record.tokenAddress,
                record.makerAddress,
                info.toString(),
                now);
        }
        else if (info.status == Classification::RECENTLY_REGISTERED) {
            m_logger->warn(info.toString());
        }
        else {
            m_logger->trace(info.toString());
        }
        lookup.insert_or_assign(record.makerAddress, info.effectiveBalance());
    }

    return lookup;
}

//-------------------------------------------------------------------------

void FirmQuoteValidator::backfill(
    const Address& tokenAddress, const std::set<Address>& makerAddresses, Timestamp now) const
{
    const auto entries = makerAddresses
        | views::transform([&tokenAddress, now](const Address& makerAddress) {
            return cache::BackfillEntry{
                .tokenAddress = tokenAddress,
                .makerAddress = makerAddress,
                .timeFirstSeen = now
            };
        })
        | ranges::to<std::vector>();

    m_logger->info(
        "Adding new addresses to cache for token {}: [{}]",
        tokenAddress, fmt::join(makerAddresses, ", "));

    try {
        const size_t inserted = m_repository->upsertIgnoreConflict(entries);
        m_signals.backfill(BackfillEvent{
            .timestamp = now,
            .tokenAddress = tokenAddress,
            .makerAddresses = {makerAddresses.begin(), makerAddresses.end()},
            .inserted = inserted
        });
    }
    catch (const cache::CacheRepositoryException& exc) {
        reportAnomaly(
            AnomalyKind::BACKFILL_FAILURE,
            tokenAddress,
            {},
            fmt::format(
                "Failed to add new addresses to cache for token {}: {}", tokenAddress, exc.what()),
            now);
    }
}

//-------------------------------------------------------------------------

void FirmQuoteValidator::reportAnomaly(
    AnomalyKind kind,
    const Address& tokenAddress,
    const Address& makerAddress,
    std::string message,
    Timestamp now) const
{
    m_logger->error("{}: {}", kind, message);
    m_signals.anomaly(AnomalyEvent{
        .timestamp = now,
        .kind = kind,
        .tokenAddress = tokenAddress,
        .makerAddress = makerAddress,
        .message = std::move(message)
    });
}

//-------------------------------------------------------------------------

}  // namespace firmquote::validator

//-------------------------------------------------------------------------
