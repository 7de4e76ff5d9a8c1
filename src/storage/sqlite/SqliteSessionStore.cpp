#include "portalgate/storage/sqlite/SqliteSessionStoreFactory.hpp"

#include "SqliteDb.hpp"
#include "portalgate/log/Loggers.hpp"
#include "portalgate/storage/ISessionStore.hpp"
#include "portalgate/storage/StorageErrors.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace portalgate::storage::sqlite
{
namespace
{

using portalgate::core::SessionState;
using portalgate::core::SessionView;

constexpr int g_kColState{ 0 };
constexpr int g_kColToken{ 1 };
constexpr int g_kColCreatedAt{ 2 };
constexpr int g_kColExpiresAt{ 3 };
constexpr int g_kColLastSeenAt{ 4 };
constexpr int g_kColUserAgent{ 5 };
constexpr int g_kColAddress{ 6 };

// Reads columns state, token, created_at, expires_at, last_seen_at, user_agent of the current row.
[[nodiscard]] SessionView readRow(sqlite3_stmt* stmt, std::string address)
{
    SessionView view{};
    view.address = std::move(address);

    const auto rawState = sqlite3_column_int(stmt, g_kColState);
    view.state = (rawState == static_cast<int>(SessionState::Authenticated)) ? SessionState::Authenticated
                                                                              : SessionState::Unauthenticated;
    if (sqlite3_column_type(stmt, g_kColToken) != SQLITE_NULL)
    {
        view.token = columnText(stmt, g_kColToken);
    }
    view.createdAt = portalgate::core::fromUnixSeconds(sqlite3_column_int64(stmt, g_kColCreatedAt));
    view.expiresAt = portalgate::core::fromUnixSeconds(sqlite3_column_int64(stmt, g_kColExpiresAt));
    view.lastSeenAt = portalgate::core::fromUnixSeconds(sqlite3_column_int64(stmt, g_kColLastSeenAt));
    view.userAgent = columnText(stmt, g_kColUserAgent);

    if (view.isAuthenticated() && (!view.token.has_value() || view.token->empty()))
    {
        throw StoreIoError("storage: authenticated row without token");
    }
    return view;
}

void demoteInView(SessionView& view) noexcept
{
    view.state = SessionState::Unauthenticated;
    view.token.reset();
}

class SqliteSessionStore final : public portalgate::storage::ISessionStore
{
public:
    SqliteSessionStore(const std::filesystem::path& dbPath, const SqliteStoreOptions& options,
                       portalgate::core::NowProvider now)
        : m_now(std::move(now)), m_pool(dbPath, options), m_log(portalgate::log::logger("store"))
    {
        m_log->info("session store ready at {} ({} connections)", dbPath.string(), options.poolSize);
    }

    [[nodiscard]] SessionView get(std::string_view address) override
    {
        auto key{ requireAddress(address) };
        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        auto stmt{ prepare(db, "SELECT state, token, created_at, expires_at, last_seen_at, user_agent"
                               " FROM device_sessions WHERE address = ?;") };
        bindText(db, stmt.get(), 1, key, "storage: bind address failed");

        const int stepRc = sqlite3_step(stmt.get());
        if (stepRc == SQLITE_DONE)
        {
            return portalgate::core::unauthenticatedView(key);
        }
        if (stepRc != SQLITE_ROW)
        {
            throw StoreIoError(sqliteErr(db, "storage: select session failed"));
        }

        auto view{ readRow(stmt.get(), std::move(key)) };
        stmt.reset();

        if (!view.isAuthenticated())
        {
            return view;
        }
        if (m_now() < *view.expiresAt)
        {
            return view;
        }

        demoteIfUnchanged(db, view);
        demoteInView(view);
        return view;
    }

    void put(std::string_view address, std::string_view token, portalgate::core::Duration ttl) override
    {
        const auto key{ requireAddress(address) };
        if (token.empty())
        {
            throw std::invalid_argument("storage: empty token");
        }
        if (ttl.count() <= 0)
        {
            throw std::invalid_argument("storage: ttl must be positive");
        }

        const auto now{ m_now() };
        const auto nowSecs{ portalgate::core::toUnixSeconds(now) };
        const auto expiresSecs{ portalgate::core::toUnixSeconds(now + ttl) };

        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        auto stmt{ prepare(db, "INSERT INTO device_sessions(address, state, token, created_at, expires_at, last_seen_at)"
                               " VALUES (?, 1, ?, ?, ?, ?)"
                               " ON CONFLICT(address) DO UPDATE SET state=1, token=excluded.token,"
                               " created_at=excluded.created_at, expires_at=excluded.expires_at,"
                               " last_seen_at=excluded.last_seen_at;") };
        bindText(db, stmt.get(), 1, key, "storage: bind address failed");
        bindText(db, stmt.get(), 2, token, "storage: bind token failed");
        bindInt64(db, stmt.get(), 3, nowSecs, "storage: bind created_at failed");
        bindInt64(db, stmt.get(), 4, expiresSecs, "storage: bind expires_at failed");
        bindInt64(db, stmt.get(), 5, nowSecs, "storage: bind last_seen_at failed");
        stepDone(db, stmt.get(), "storage: upsert session failed");

        m_log->debug("[{}] session stored, expires in {}s", key, ttl.count());
    }

    void setUserAgent(std::string_view address, std::string_view userAgent) override
    {
        const auto key{ requireAddress(address) };
        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        auto stmt{ prepare(db, "UPDATE device_sessions SET user_agent = ? WHERE address = ?;") };
        bindText(db, stmt.get(), 1, userAgent, "storage: bind user_agent failed");
        bindText(db, stmt.get(), 2, key, "storage: bind address failed");
        stepDone(db, stmt.get(), "storage: record user agent failed");
    }

    void remove(std::string_view address) override
    {
        const auto key{ requireAddress(address) };
        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        auto stmt{ prepare(db, "DELETE FROM device_sessions WHERE address = ?;") };
        bindText(db, stmt.get(), 1, key, "storage: bind address failed");
        stepDone(db, stmt.get(), "storage: delete session failed");

        if (sqlite3_changes(db) > 0)
        {
            m_log->debug("[{}] session removed", key);
        }
    }

    void touch(std::string_view address) override
    {
        const auto key{ requireAddress(address) };
        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        auto stmt{ prepare(db, "UPDATE device_sessions SET last_seen_at = ? WHERE address = ?;") };
        bindInt64(db, stmt.get(), 1, portalgate::core::toUnixSeconds(m_now()), "storage: bind last_seen_at failed");
        bindText(db, stmt.get(), 2, key, "storage: bind address failed");
        stepDone(db, stmt.get(), "storage: touch session failed");
    }

    [[nodiscard]] std::vector<SessionView> list(std::size_t limit) override
    {
        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        (void)demoteExpired(db);

        auto stmt{ prepare(db, "SELECT state, token, created_at, expires_at, last_seen_at, user_agent, address"
                               " FROM device_sessions ORDER BY last_seen_at DESC, address ASC LIMIT ?;") };
        bindInt64(db, stmt.get(), 1, static_cast<std::int64_t>(limit), "storage: bind limit failed");

        std::vector<SessionView> out;
        while (true)
        {
            const int stepRc = sqlite3_step(stmt.get());
            if (stepRc == SQLITE_DONE)
            {
                break;
            }
            if (stepRc != SQLITE_ROW)
            {
                throw StoreIoError(sqliteErr(db, "storage: list sessions failed"));
            }
            out.push_back(readRow(stmt.get(), columnText(stmt.get(), g_kColAddress)));
        }
        return out;
    }

    std::size_t sweepExpired() override
    {
        const auto lease{ m_pool.acquire() };
        const auto demoted{ demoteExpired(lease->get()) };
        if (demoted > 0U)
        {
            m_log->info("sweep demoted {} expired session(s)", demoted);
        }
        return demoted;
    }

private:
    // Guarded on the observed expiry so a concurrent re-authentication is never clobbered.
    void demoteIfUnchanged(sqlite3* db, const SessionView& observed)
    {
        auto stmt{ prepare(db, "UPDATE device_sessions SET state = 0, token = NULL"
                               " WHERE address = ? AND state = 1 AND expires_at = ?;") };
        bindText(db, stmt.get(), 1, observed.address, "storage: bind address failed");
        bindInt64(db, stmt.get(), 2, portalgate::core::toUnixSeconds(*observed.expiresAt),
                  "storage: bind expires_at failed");
        stepDone(db, stmt.get(), "storage: demote session failed");

        if (sqlite3_changes(db) > 0)
        {
            m_log->info("[{}] session expired, demoted", observed.address);
        }
    }

    [[nodiscard]] std::size_t demoteExpired(sqlite3* db)
    {
        auto stmt{ prepare(db, "UPDATE device_sessions SET state = 0, token = NULL"
                               " WHERE state = 1 AND expires_at <= ?;") };
        bindInt64(db, stmt.get(), 1, portalgate::core::toUnixSeconds(m_now()), "storage: bind now failed");
        stepDone(db, stmt.get(), "storage: sweep expired failed");
        return static_cast<std::size_t>(sqlite3_changes(db));
    }

    portalgate::core::NowProvider m_now;
    ConnectionPool m_pool;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace

[[nodiscard]] std::unique_ptr<portalgate::storage::ISessionStore>
makeSqliteSessionStore(const std::filesystem::path& dbPath, SqliteStoreOptions options, portalgate::core::NowProvider now)
{
    prepareDatabaseDirectory(dbPath);
    return std::make_unique<SqliteSessionStore>(dbPath, options, std::move(now));
}

} // namespace portalgate::storage::sqlite
