#ifndef PORTALGATE_STORAGE_SQLITE_SQLITEDB_HPP
#define PORTALGATE_STORAGE_SQLITE_SQLITEDB_HPP

#include "portalgate/storage/sqlite/SqliteSessionStoreFactory.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace portalgate::storage::sqlite
{

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

// All helpers below throw StoreIoError on any SQLite failure.
[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix);
void exec(sqlite3* db, const char* sql);
[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const char* sql);
void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view value, const char* what);
void bindInt64(sqlite3* db, sqlite3_stmt* stmt, int index, std::int64_t value, const char* what);
void stepDone(sqlite3* db, sqlite3_stmt* stmt, const char* what);
// Steps a statement expected to yield at most one row; false when it yields none.
[[nodiscard]] bool stepRow(sqlite3* db, sqlite3_stmt* stmt, const char* what);
[[nodiscard]] std::string columnText(sqlite3_stmt* stmt, int col);

// Normalized form of `address`; throws std::invalid_argument when it is not an IP literal.
[[nodiscard]] std::string requireAddress(std::string_view address);

// Fixed set of connections to one database file, each borrowed for a single operation.
// The first connection creates or upgrades the schema.
class ConnectionPool final
{
public:
    class Lease final
    {
    public:
        Lease(ConnectionPool& pool, SqliteDbPtr db) noexcept : m_pool(&pool), m_db(std::move(db))
        {
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&&) = delete;
        Lease& operator=(Lease&&) = delete;
        ~Lease() noexcept
        {
            m_pool->release(std::move(m_db));
        }

        [[nodiscard]] sqlite3* get() const noexcept
        {
            return m_db.get();
        }

    private:
        ConnectionPool* m_pool;
        SqliteDbPtr m_db;
    };

    ConnectionPool(const std::filesystem::path& dbPath, const SqliteStoreOptions& options);

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;
    ~ConnectionPool() = default;

    [[nodiscard]] std::unique_ptr<Lease> acquire();

private:
    void release(SqliteDbPtr db) noexcept;

    std::chrono::milliseconds m_waitTimeout;
    std::mutex m_mutex;
    std::condition_variable m_available;
    std::vector<SqliteDbPtr> m_idle;
};

// Creates the parent directory of `dbPath` when missing.
void prepareDatabaseDirectory(const std::filesystem::path& dbPath);

} // namespace portalgate::storage::sqlite

#endif // PORTALGATE_STORAGE_SQLITE_SQLITEDB_HPP
