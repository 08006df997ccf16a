/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "firmquote/cache/ICacheRepository.hpp"
#include "common.hpp"

#include <shared_mutex>

//-------------------------------------------------------------------------

namespace firmquote::cache
{

//-------------------------------------------------------------------------

class InMemoryCacheRepository : public ICacheRepository
{
public:
    InMemoryCacheRepository() noexcept;

    [[nodiscard]] virtual std::vector<CacheRecord> find(
        const Address& tokenAddress, const std::set<Address>& makerAddresses) const override;
    virtual size_t upsertIgnoreConflict(std::span<const BackfillEntry> entries) override;

    // Sampler-side write: creates or refreshes the record with a new balance.
    void recordSample(
        const Address& tokenAddress,
        const Address& makerAddress,
        decimal_t balance,
        Timestamp timeOfSample);

    // Overwrites the record verbatim, including anomalous shapes.
    void put(CacheRecord record);

    [[nodiscard]] std::optional<CacheRecord> get(const CacheKey& key) const;
    [[nodiscard]] size_t size() const;

private:
    std::map<CacheKey, CacheRecord> m_records;
    std::unique_ptr<std::shared_mutex> m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace firmquote::cache

//-------------------------------------------------------------------------
