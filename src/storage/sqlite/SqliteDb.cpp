#include "SqliteDb.hpp"

#include "portalgate/core/Address.hpp"
#include "portalgate/storage/StorageErrors.hpp"
#include <stdexcept>
#include <system_error>

namespace portalgate::storage::sqlite
{
namespace
{

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path, std::chrono::milliseconds busyTimeout)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, flags, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw StoreIoError(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }

    if (sqlite3_busy_timeout(db.get(), static_cast<int>(busyTimeout.count())) != SQLITE_OK)
    {
        throw StoreIoError(sqliteErr(db.get(), "storage: sqlite3_busy_timeout failed"));
    }

    // WAL lets readers proceed during a writer's commit; FULL sync makes each commit durable.
    exec(db.get(), "PRAGMA journal_mode=WAL;");
    exec(db.get(), "PRAGMA synchronous=FULL;");
    return db;
}

[[nodiscard]] bool hasColumn(sqlite3* db, const char* table, std::string_view column)
{
    const std::string sql{ std::string{ "PRAGMA table_info(" } + table + ");" };
    auto stmt{ prepare(db, sql.c_str()) };
    constexpr int kNameColumn{ 1 };
    while (true)
    {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE)
        {
            return false;
        }
        if (rc != SQLITE_ROW)
        {
            throw StoreIoError(sqliteErr(db, "storage: table_info failed"));
        }
        if (columnText(stmt.get(), kNameColumn) == column)
        {
            return true;
        }
    }
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS device_sessions ("
             " address TEXT PRIMARY KEY NOT NULL,"
             " state INTEGER NOT NULL CHECK(state IN (0, 1)),"
             " token TEXT,"
             " created_at INTEGER NOT NULL,"
             " expires_at INTEGER NOT NULL,"
             " last_seen_at INTEGER NOT NULL,"
             " user_agent TEXT,"
             " CHECK(state = 0 OR (token IS NOT NULL AND expires_at > created_at))"
             ");");

    // Files created before user agents were recorded.
    if (!hasColumn(db, "device_sessions", "user_agent"))
    {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, "ALTER TABLE device_sessions ADD COLUMN user_agent TEXT;", nullptr, nullptr,
                                    &errMsg);
        sqlite3_free(errMsg);
        // Another process may have added it first.
        if (rc != SQLITE_OK && !hasColumn(db, "device_sessions", "user_agent"))
        {
            throw StoreIoError(sqliteErr(db, "storage: adding device_sessions.user_agent failed"));
        }
    }

    exec(db, "CREATE TABLE IF NOT EXISTS login_attempts ("
             " id INTEGER PRIMARY KEY AUTOINCREMENT,"
             " address TEXT NOT NULL,"
             " username TEXT NOT NULL,"
             " success INTEGER NOT NULL CHECK(success IN (0, 1)),"
             " attempted_at INTEGER NOT NULL,"
             " user_agent TEXT NOT NULL DEFAULT ''"
             ");");
    exec(db, "CREATE INDEX IF NOT EXISTS login_attempts_by_address ON login_attempts(address, id);");
    exec(db, "CREATE INDEX IF NOT EXISTS login_attempts_by_time ON login_attempts(attempted_at);");

    exec(db, "CREATE TABLE IF NOT EXISTS address_lockouts ("
             " address TEXT PRIMARY KEY NOT NULL,"
             " locked_until INTEGER NOT NULL,"
             " failures INTEGER NOT NULL"
             ");");
}

} // namespace

std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw StoreIoError(msg);
    }
}

SqliteStmtPtr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw StoreIoError(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view value, const char* what)
{
    if (sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK)
    {
        throw StoreIoError(sqliteErr(db, what));
    }
}

void bindInt64(sqlite3* db, sqlite3_stmt* stmt, int index, std::int64_t value, const char* what)
{
    if (sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK)
    {
        throw StoreIoError(sqliteErr(db, what));
    }
}

void stepDone(sqlite3* db, sqlite3_stmt* stmt, const char* what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE)
    {
        throw StoreIoError(sqliteErr(db, what));
    }
}

bool stepRow(sqlite3* db, sqlite3_stmt* stmt, const char* what)
{
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
    {
        return true;
    }
    if (rc != SQLITE_DONE)
    {
        throw StoreIoError(sqliteErr(db, what));
    }
    return false;
}

std::string columnText(sqlite3_stmt* stmt, int col)
{
    const unsigned char* text = sqlite3_column_text(stmt, col);
    const int bytes = sqlite3_column_bytes(stmt, col);
    if (text == nullptr || bytes <= 0)
    {
        return {};
    }
    return std::string{ reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes) };
}

std::string requireAddress(std::string_view address)
{
    auto normalized{ portalgate::core::normalizeAddress(address) };
    if (!normalized.has_value())
    {
        throw std::invalid_argument("storage: malformed address");
    }
    return std::move(*normalized);
}

ConnectionPool::ConnectionPool(const std::filesystem::path& dbPath, const SqliteStoreOptions& options)
    : m_waitTimeout(options.busyTimeout)
{
    if (options.poolSize == 0U)
    {
        throw std::invalid_argument("storage: pool size must be positive");
    }

    m_idle.reserve(options.poolSize);
    for (std::size_t i{}; i < options.poolSize; ++i)
    {
        auto db{ openDb(dbPath, options.busyTimeout) };
        if (i == 0U)
        {
            ensureSchema(db.get());
        }
        m_idle.push_back(std::move(db));
    }
}

std::unique_ptr<ConnectionPool::Lease> ConnectionPool::acquire()
{
    std::unique_lock<std::mutex> lock{ m_mutex };
    if (!m_available.wait_for(lock, m_waitTimeout, [this]() { return !m_idle.empty(); }))
    {
        throw StoreIoError("storage: timed out waiting for a database connection");
    }
    SqliteDbPtr db{ std::move(m_idle.back()) };
    m_idle.pop_back();
    return std::make_unique<Lease>(*this, std::move(db));
}

void ConnectionPool::release(SqliteDbPtr db) noexcept
{
    {
        const std::lock_guard<std::mutex> lock{ m_mutex };
        m_idle.push_back(std::move(db));
    }
    m_available.notify_one();
}

void prepareDatabaseDirectory(const std::filesystem::path& dbPath)
{
    std::error_code ec{};
    const auto parent{ dbPath.parent_path() };
    if (!parent.empty() && !std::filesystem::exists(parent, ec))
    {
        if (!std::filesystem::create_directories(parent, ec) || ec)
        {
            throw StoreIoError("storage: failed to create database directory");
        }
    }
}

} // namespace portalgate::storage::sqlite
