/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "SqliteCacheRepository.hpp"

//-------------------------------------------------------------------------

namespace firmquote::cache
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::string placeholders(size_t count, std::string_view tuple)
{
    return fmt::format("{}", fmt::join(views::repeat_n(tuple, count), ","));
}

// Rolls back on scope exit unless committed.
class TransactionGuard
{
public:
    explicit TransactionGuard(sqlite3* db) noexcept : m_db{db} {}

    ~TransactionGuard()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    void commit() noexcept { m_committed = true; }

private:
    sqlite3* m_db;
    bool m_committed{};
};

}  // namespace

//-------------------------------------------------------------------------

SqliteCacheRepository::SqliteCacheRepository(
    const fs::path& dbPath, std::chrono::milliseconds busyTimeout)
    : m_path{dbPath}, m_mtx{std::make_unique<std::shared_mutex>()}
{
    sqlite3* db{};
    const int rc = sqlite3_open_v2(
        m_path.c_str(),
        &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr);
    m_db.reset(db);
    if (rc != SQLITE_OK) {
        fail("sqlite3_open_v2");
    }
    sqlite3_busy_timeout(m_db.get(), static_cast<int>(busyTimeout.count()));
    initSchema();
}

//-------------------------------------------------------------------------

std::vector<CacheRecord> SqliteCacheRepository::find(
    const Address& tokenAddress, const std::set<Address>& makerAddresses) const
{
    std::shared_lock lock{*m_mtx};
    std::vector<CacheRecord> records;
    const std::vector<Address> makers(makerAddresses.begin(), makerAddresses.end());

    for (const auto& chunk : makers | views::chunk(s_maxRowsPerStatement)) {
        const auto chunkSize = static_cast<size_t>(ranges::distance(chunk));
        auto stmt = prepare(fmt::format(
            "SELECT token_address, maker_address, balance, time_first_seen, time_of_sample "
            "FROM {} WHERE token_address = ? AND maker_address IN ({});",
            s_tableName,
            placeholders(chunkSize, "?")));

        int idx = 1;
        bindText(stmt.get(), idx++, tokenAddress);
        for (const auto& makerAddress : chunk) {
            bindText(stmt.get(), idx++, makerAddress);
        }

        for (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE; rc = sqlite3_step(stmt.get())) {
            if (rc != SQLITE_ROW) {
                fail("sqlite3_step(find)");
            }
            records.push_back(readRecord(stmt.get()));
        }
    }

    return records;
}

//-------------------------------------------------------------------------

size_t SqliteCacheRepository::upsertIgnoreConflict(std::span<const BackfillEntry> entries)
{
    if (entries.empty()) {
        return 0;
    }

    std::unique_lock lock{*m_mtx};

    exec("BEGIN IMMEDIATE;");
    TransactionGuard transaction{m_db.get()};

    size_t inserted{};
    for (const auto& chunk : entries | views::chunk(s_maxRowsPerStatement)) {
        const auto chunkSize = static_cast<size_t>(ranges::distance(chunk));
        auto stmt = prepare(fmt::format(
            "INSERT INTO {} (token_address, maker_address, time_first_seen) VALUES {} "
            "ON CONFLICT(token_address, maker_address) DO NOTHING;",
            s_tableName,
            placeholders(chunkSize, "(?, ?, ?)")));

        int idx = 1;
        for (const auto& entry : chunk) {
            bindText(stmt.get(), idx++, entry.tokenAddress);
            bindText(stmt.get(), idx++, entry.makerAddress);
            bindTimestamp(stmt.get(), idx++, entry.timeFirstSeen);
        }

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            fail("sqlite3_step(upsertIgnoreConflict)");
        }
        inserted += static_cast<size_t>(sqlite3_changes(m_db.get()));

        // Unsampled rows keep the earliest time_first_seen proposed.
        auto lower = prepare(fmt::format(
            "UPDATE {0} SET time_first_seen = proposed.t "
            "FROM (SELECT column1 AS token, column2 AS maker, MIN(column3) AS t "
            "FROM (VALUES {1}) GROUP BY column1, column2) AS proposed "
            "WHERE {0}.token_address = proposed.token AND {0}.maker_address = proposed.maker "
            "AND {0}.time_of_sample IS NULL "
            "AND ({0}.time_first_seen IS NULL OR {0}.time_first_seen > proposed.t);",
            s_tableName,
            placeholders(chunkSize, "(?, ?, ?)")));

        idx = 1;
        for (const auto& entry : chunk) {
            bindText(lower.get(), idx++, entry.tokenAddress);
            bindText(lower.get(), idx++, entry.makerAddress);
            bindTimestamp(lower.get(), idx++, entry.timeFirstSeen);
        }

        if (sqlite3_step(lower.get()) != SQLITE_DONE) {
            fail("sqlite3_step(upsertIgnoreConflict)");
        }
    }

    exec("COMMIT;");
    transaction.commit();

    return inserted;
}

//-------------------------------------------------------------------------

void SqliteCacheRepository::recordSample(
    const Address& tokenAddress,
    const Address& makerAddress,
    const decimal_t& balance,
    Timestamp timeOfSample)
{
    const std::string balanceStr = util::decimalToString(balance);
    if (!util::tryParseDecimal(balanceStr)) {
        throw std::invalid_argument{fmt::format(
            "{}: balance {} has no finite decimal representation",
            std::source_location::current().function_name(),
            balanceStr)};
    }

    std::unique_lock lock{*m_mtx};

    auto stmt = prepare(fmt::format(
        "INSERT INTO {} (token_address, maker_address, balance, time_first_seen, time_of_sample) "
        "VALUES (?, ?, ?, ?, ?) "
        "ON CONFLICT(token_address, maker_address) DO UPDATE SET "
        "balance = excluded.balance, time_of_sample = excluded.time_of_sample;",
        s_tableName));

    bindText(stmt.get(), 1, tokenAddress);
    bindText(stmt.get(), 2, makerAddress);
    bindText(stmt.get(), 3, balanceStr);
    bindTimestamp(stmt.get(), 4, timeOfSample);
    bindTimestamp(stmt.get(), 5, timeOfSample);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        fail("sqlite3_step(recordSample)");
    }
}

//-------------------------------------------------------------------------

void SqliteCacheRepository::initSchema()
{
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    exec(fmt::format(
        "CREATE TABLE IF NOT EXISTS {} ("
        "  token_address TEXT NOT NULL,"
        "  maker_address TEXT NOT NULL,"
        "  balance TEXT,"
        "  time_first_seen INTEGER,"
        "  time_of_sample INTEGER,"
        "  PRIMARY KEY (token_address, maker_address)"
        ");",
        s_tableName));
}

//-------------------------------------------------------------------------

void SqliteCacheRepository::exec(const std::string& sql) const
{
    char* err{};
    if (sqlite3_exec(m_db.get(), sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        const std::string msg = err != nullptr ? err : sqlite3_errmsg(m_db.get());
        sqlite3_free(err);
        throw CacheRepositoryException{fmt::format(
            "{}: sqlite3_exec failed on '{}': {}",
            std::source_location::current().function_name(),
            m_path.c_str(),
            msg)};
    }
}

//-------------------------------------------------------------------------

SqliteCacheRepository::Statement SqliteCacheRepository::prepare(const std::string& sql) const
{
    sqlite3_stmt* stmt{};
    if (sqlite3_prepare_v2(m_db.get(), sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("sqlite3_prepare_v2");
    }
    return Statement{stmt};
}

//-------------------------------------------------------------------------

void SqliteCacheRepository::bindText(sqlite3_stmt* stmt, int idx, const std::string& text) const
{
    if (sqlite3_bind_text(stmt, idx, text.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        fail("sqlite3_bind_text");
    }
}

//-------------------------------------------------------------------------

void SqliteCacheRepository::bindTimestamp(sqlite3_stmt* stmt, int idx, Timestamp timestamp) const
{
    if (sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(timestamp)) != SQLITE_OK) {
        fail("sqlite3_bind_int64");
    }
}

//-------------------------------------------------------------------------

CacheRecord SqliteCacheRepository::readRecord(sqlite3_stmt* stmt) const
{
    auto text = [stmt](int col) -> std::optional<std::string> {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(sqlite3_column_text(stmt, col))};
    };
    auto timestamp = [stmt](int col) -> std::optional<Timestamp> {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
        return static_cast<Timestamp>(sqlite3_column_int64(stmt, col));
    };

    CacheRecord record{
        .tokenAddress = text(0).value_or(""),
        .makerAddress = text(1).value_or(""),
        .timeFirstSeen = timestamp(3),
        .timeOfSample = timestamp(4)
    };
    if (auto balance = text(2)) {
        record.balance = util::tryParseDecimal(*balance);
        if (!record.balance) {
            throw CacheRepositoryException{fmt::format(
                "{}: malformed balance '{}' stored for maker {} and token {} in '{}'",
                std::source_location::current().function_name(),
                *balance,
                record.makerAddress,
                record.tokenAddress,
                m_path.c_str())};
        }
    }
    return record;
}

//-------------------------------------------------------------------------

void SqliteCacheRepository::fail(std::string_view where) const
{
    throw CacheRepositoryException{fmt::format(
        "SqliteCacheRepository: {} failed on '{}': {}",
        where,
        m_path.c_str(),
        m_db ? sqlite3_errmsg(m_db.get()) : "out of memory")};
}

//-------------------------------------------------------------------------

}  // namespace firmquote::cache

//-------------------------------------------------------------------------
