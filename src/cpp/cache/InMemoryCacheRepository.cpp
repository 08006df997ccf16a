/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "InMemoryCacheRepository.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace firmquote::cache
{

//-------------------------------------------------------------------------

InMemoryCacheRepository::InMemoryCacheRepository() noexcept
    : m_mtx{std::make_unique<std::shared_mutex>()}
{}

//-------------------------------------------------------------------------

std::vector<CacheRecord> InMemoryCacheRepository::find(
    const Address& tokenAddress, const std::set<Address>& makerAddresses) const
{
    std::shared_lock lock{*m_mtx};
    std::vector<CacheRecord> records;
    for (const auto& makerAddress : makerAddresses) {
        if (auto it = m_records.find({tokenAddress, makerAddress}); it != m_records.end()) {
            records.push_back(it->second);
        }
    }
    return records;
}

//-------------------------------------------------------------------------

size_t InMemoryCacheRepository::upsertIgnoreConflict(std::span<const BackfillEntry> entries)
{
    std::unique_lock lock{*m_mtx};
    size_t inserted{};
    for (const auto& entry : entries) {
        const auto [it, isNew] = m_records.try_emplace(
            CacheKey{entry.tokenAddress, entry.makerAddress},
            CacheRecord{
                .tokenAddress = entry.tokenAddress,
                .makerAddress = entry.makerAddress,
                .timeFirstSeen = entry.timeFirstSeen
            });
        if (isNew) {
            ++inserted;
            continue;
        }
        // An unsampled row keeps the earliest registration time seen.
        auto& record = it->second;
        if (!record.timeOfSample
            && (!record.timeFirstSeen || *record.timeFirstSeen > entry.timeFirstSeen)) {
            record.timeFirstSeen = entry.timeFirstSeen;
        }
    }
    return inserted;
}

//-------------------------------------------------------------------------

void InMemoryCacheRepository::recordSample(
    const Address& tokenAddress,
    const Address& makerAddress,
    decimal_t balance,
    Timestamp timeOfSample)
{
    std::unique_lock lock{*m_mtx};
    auto it = m_records.try_emplace(
        CacheKey{tokenAddress, makerAddress},
        CacheRecord{
            .tokenAddress = tokenAddress,
            .makerAddress = makerAddress,
            .timeFirstSeen = timeOfSample
        }).first;
    it->second.balance = std::move(balance);
    it->second.timeOfSample = timeOfSample;
}

//-------------------------------------------------------------------------

void InMemoryCacheRepository::put(CacheRecord record)
{
    std::unique_lock lock{*m_mtx};
    auto key = record.key();
    m_records.insert_or_assign(std::move(key), std::move(record));
}

//-------------------------------------------------------------------------

std::optional<CacheRecord> InMemoryCacheRepository::get(const CacheKey& key) const
{
    std::shared_lock lock{*m_mtx};
    if (auto it = m_records.find(key); it != m_records.end()) {
        return it->second;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

size_t InMemoryCacheRepository::size() const
{
    std::shared_lock lock{*m_mtx};
    return m_records.size();
}

//-------------------------------------------------------------------------

}  // namespace firmquote::cache

//-------------------------------------------------------------------------
