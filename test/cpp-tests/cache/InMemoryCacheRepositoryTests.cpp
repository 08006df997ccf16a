/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "InMemoryCacheRepository.hpp"
#include "test-common/formatting.hpp"
#include "test-common/quotes.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>

//-------------------------------------------------------------------------

using namespace firmquote;
using namespace firmquote::cache;
using namespace firmquote::test;

using namespace testing;

//-------------------------------------------------------------------------

TEST(InMemoryCacheRepositoryTest, FindReturnsOnlyRequestedMakersOfToken)
{
    InMemoryCacheRepository repo;
    repo.recordSample(kTokenX, kMakerA, DEC(10), 1000);
    repo.recordSample(kTokenX, kMakerB, DEC(20), 1000);
    repo.recordSample(kTokenY, kMakerA, DEC(30), 1000);

    const auto records = repo.find(kTokenX, {kMakerA, kMakerC});

    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records[0].tokenAddress, kTokenX);
    EXPECT_EQ(records[0].makerAddress, kMakerA);
    EXPECT_EQ(records[0].balance, DEC(10));
    EXPECT_EQ(records[0].timeOfSample, 1000);
}

//-------------------------------------------------------------------------

TEST(InMemoryCacheRepositoryTest, UpsertIgnoresExistingKeys)
{
    InMemoryCacheRepository repo;
    repo.recordSample(kTokenX, kMakerA, DEC(10), 1000);

    const std::vector<BackfillEntry> entries{
        {.tokenAddress = kTokenX, .makerAddress = kMakerA, .timeFirstSeen = 5000},
        {.tokenAddress = kTokenX, .makerAddress = kMakerB, .timeFirstSeen = 5000}
    };
    EXPECT_EQ(repo.upsertIgnoreConflict(entries), 1);
    EXPECT_EQ(repo.upsertIgnoreConflict(entries), 0);
    EXPECT_EQ(repo.size(), 2);

    const auto sampled = repo.get({kTokenX, kMakerA});
    ASSERT_TRUE(sampled.has_value());
    EXPECT_EQ(sampled->balance, DEC(10));
    EXPECT_EQ(sampled->timeFirstSeen, 1000);
    EXPECT_EQ(sampled->timeOfSample, 1000);

    const auto registered = repo.get({kTokenX, kMakerB});
    ASSERT_TRUE(registered.has_value());
    EXPECT_FALSE(registered->balance.has_value());
    EXPECT_EQ(registered->timeFirstSeen, 5000);
    EXPECT_FALSE(registered->timeOfSample.has_value());
}

//-------------------------------------------------------------------------

TEST(InMemoryCacheRepositoryTest, RecordSampleKeepsTimeFirstSeen)
{
    InMemoryCacheRepository repo;
    const std::vector<BackfillEntry> entries{
        {.tokenAddress = kTokenX, .makerAddress = kMakerA, .timeFirstSeen = 500}
    };
    ASSERT_EQ(repo.upsertIgnoreConflict(entries), 1);

    repo.recordSample(kTokenX, kMakerA, DEC(7.5), 900);

    const auto record = repo.get({kTokenX, kMakerA});
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->balance, DEC(7.5));
    EXPECT_EQ(record->timeFirstSeen, 500);
    EXPECT_EQ(record->timeOfSample, 900);
}

//-------------------------------------------------------------------------

TEST(InMemoryCacheRepositoryTest, ConcurrentUpsertsLeaveOneRow)
{
    static constexpr int kThreadCount = 8;

    InMemoryCacheRepository repo;
    std::atomic<size_t> inserted{};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreadCount; ++i) {
        threads.emplace_back([&repo, &inserted] {
            const std::vector<BackfillEntry> entries{
                {.tokenAddress = kTokenX, .makerAddress = kMakerA, .timeFirstSeen = 100},
                {.tokenAddress = kTokenX, .makerAddress = kMakerB, .timeFirstSeen = 100}
            };
            inserted += repo.upsertIgnoreConflict(entries);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(inserted.load(), 2);
    EXPECT_EQ(repo.size(), 2);
    EXPECT_THAT(repo.find(kTokenX, {kMakerA, kMakerB}), SizeIs(2));
}

//-------------------------------------------------------------------------

TEST(InMemoryCacheRepositoryTest, UpsertKeepsEarliestTimeFirstSeen)
{
    InMemoryCacheRepository repo;
    repo.recordSample(kTokenX, kMakerB, DEC(3), 4000);

    auto upsert = [&repo](Timestamp timeFirstSeen) {
        const std::vector<BackfillEntry> entries{
            {.tokenAddress = kTokenX, .makerAddress = kMakerA, .timeFirstSeen = timeFirstSeen},
            {.tokenAddress = kTokenX, .makerAddress = kMakerB, .timeFirstSeen = timeFirstSeen}
        };
        return repo.upsertIgnoreConflict(entries);
    };

    EXPECT_EQ(upsert(2000), 1);
    EXPECT_EQ(upsert(1000), 0);
    EXPECT_EQ(upsert(3000), 0);

    const auto registered = repo.get({kTokenX, kMakerA});
    ASSERT_TRUE(registered.has_value());
    EXPECT_EQ(registered->timeFirstSeen, 1000);
    EXPECT_FALSE(registered->timeOfSample.has_value());

    const auto sampled = repo.get({kTokenX, kMakerB});
    ASSERT_TRUE(sampled.has_value());
    EXPECT_EQ(sampled->timeFirstSeen, 4000);
    EXPECT_EQ(sampled->balance, DEC(3));
}

//-------------------------------------------------------------------------

TEST(InMemoryCacheRepositoryTest, ConcurrentUpsertsKeepEarliestTimeFirstSeen)
{
    static constexpr int kThreadCount = 8;
    static constexpr Timestamp kEarliest = 1100;

    InMemoryCacheRepository repo;
    std::atomic<size_t> inserted{};
    std::vector<std::thread> threads;
    // Later timestamps are started first.
    for (int i = 0; i < kThreadCount; ++i) {
        const Timestamp timeFirstSeen = kEarliest + (kThreadCount - 1 - i) * 100;
        threads.emplace_back([&repo, &inserted, timeFirstSeen] {
            const std::vector<BackfillEntry> entries{
                {.tokenAddress = kTokenX, .makerAddress = kMakerA, .timeFirstSeen = timeFirstSeen}
            };
            inserted += repo.upsertIgnoreConflict(entries);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(inserted.load(), 1);
    ASSERT_EQ(repo.size(), 1);
    const auto record = repo.get({kTokenX, kMakerA});
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->timeFirstSeen, kEarliest);
}

//-------------------------------------------------------------------------
