/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "firmquote/cache/ICacheRepository.hpp"
#include "common.hpp"

#include <sqlite3.h>

#include <chrono>
#include <shared_mutex>

//-------------------------------------------------------------------------

namespace firmquote::cache
{

//-------------------------------------------------------------------------

class SqliteCacheRepository : public ICacheRepository
{
public:
    static constexpr std::string_view s_tableName = "maker_balance_chain_cache";
    static constexpr size_t s_maxRowsPerStatement = 250;

    explicit SqliteCacheRepository(
        const fs::path& dbPath,
        std::chrono::milliseconds busyTimeout = std::chrono::milliseconds{2000});

    SqliteCacheRepository(const SqliteCacheRepository&) = delete;
    SqliteCacheRepository& operator=(const SqliteCacheRepository&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return m_path; }

    [[nodiscard]] virtual std::vector<CacheRecord> find(
        const Address& tokenAddress, const std::set<Address>& makerAddresses) const override;
    virtual size_t upsertIgnoreConflict(std::span<const BackfillEntry> entries) override;

    // Sampler-side write: creates or refreshes the record with a new balance.
    void recordSample(
        const Address& tokenAddress,
        const Address& makerAddress,
        const decimal_t& balance,
        Timestamp timeOfSample);

private:
    struct ConnectionDeleter
    {
        void operator()(sqlite3* db) const noexcept { sqlite3_close_v2(db); }
    };

    struct StatementDeleter
    {
        void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
    };

    using Connection = std::unique_ptr<sqlite3, ConnectionDeleter>;
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    void initSchema();
    void exec(const std::string& sql) const;
    [[nodiscard]] Statement prepare(const std::string& sql) const;
    void bindText(sqlite3_stmt* stmt, int idx, const std::string& text) const;
    void bindTimestamp(sqlite3_stmt* stmt, int idx, Timestamp timestamp) const;
    [[nodiscard]] CacheRecord readRecord(sqlite3_stmt* stmt) const;
    [[noreturn]] void fail(std::string_view where) const;

    fs::path m_path;
    Connection m_db;
    // Readers share the lock so a find never observes a half-written upsert.
    std::unique_ptr<std::shared_mutex> m_mtx;
};

//-------------------------------------------------------------------------

}  // namespace firmquote::cache

//-------------------------------------------------------------------------
