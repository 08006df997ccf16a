/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "firmquote/cache/CacheRecord.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace firmquote::cache
{

//-------------------------------------------------------------------------

class ICacheRepository
{
public:
    using Ptr = std::shared_ptr<ICacheRepository>;

    virtual ~ICacheRepository() = default;

    // All records for `tokenAddress` whose maker is in `makerAddresses`.
    [[nodiscard]] virtual std::vector<CacheRecord> find(
        const Address& tokenAddress, const std::set<Address>& makerAddresses) const = 0;

    // Inserts each entry unless its (token, maker) key already exists. Returns
    // the number of rows actually inserted.
    virtual size_t upsertIgnoreConflict(std::span<const BackfillEntry> entries) = 0;

protected:
    ICacheRepository() = default;
};

//-------------------------------------------------------------------------

class CacheRepositoryException : public std::runtime_error
{
public:
    explicit CacheRepositoryException(const std::string& message) : std::runtime_error(message) {}
};

//-------------------------------------------------------------------------

}  // namespace firmquote::cache

//-------------------------------------------------------------------------
