/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "firmquote/cache/ICacheRepository.hpp"

#include <gmock/gmock.h>

//-------------------------------------------------------------------------

namespace firmquote::cache
{

class MockCacheRepository : public ICacheRepository
{
public:
    MOCK_METHOD(
        std::vector<CacheRecord>,
        find,
        (const Address& tokenAddress, const std::set<Address>& makerAddresses),
        (const, override));
    MOCK_METHOD(
        size_t,
        upsertIgnoreConflict,
        (std::span<const BackfillEntry> entries),
        (override));
};

}  // namespace firmquote::cache

//-------------------------------------------------------------------------
