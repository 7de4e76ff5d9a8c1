#include "portalgate/storage/sqlite/SqliteLoginAuditStoreFactory.hpp"

#include "SqliteDb.hpp"
#include "portalgate/log/Loggers.hpp"
#include "portalgate/storage/StorageErrors.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace portalgate::storage::sqlite
{
namespace
{

using portalgate::storage::LoginAttempt;

class SqliteLoginAuditStore final : public portalgate::storage::ILoginAuditStore
{
public:
    SqliteLoginAuditStore(const std::filesystem::path& dbPath, const SqliteStoreOptions& options,
                          portalgate::core::NowProvider now)
        : m_now(std::move(now)), m_pool(dbPath, options), m_log(portalgate::log::logger("store"))
    {
    }

    void recordAttempt(std::string_view address, std::string_view username, bool success,
                       std::string_view userAgent) override
    {
        const auto key{ requireAddress(address) };
        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        auto stmt{ prepare(db, "INSERT INTO login_attempts(address, username, success, attempted_at, user_agent)"
                               " VALUES (?, ?, ?, ?, ?);") };
        bindText(db, stmt.get(), 1, key, "storage: bind address failed");
        bindText(db, stmt.get(), 2, username, "storage: bind username failed");
        bindInt64(db, stmt.get(), 3, success ? 1 : 0, "storage: bind success failed");
        bindInt64(db, stmt.get(), 4, portalgate::core::toUnixSeconds(m_now()), "storage: bind attempted_at failed");
        bindText(db, stmt.get(), 5, userAgent, "storage: bind user_agent failed");
        stepDone(db, stmt.get(), "storage: insert login attempt failed");
    }

    [[nodiscard]] std::size_t failuresSince(std::string_view address, portalgate::core::TimePoint since) override
    {
        const auto key{ requireAddress(address) };
        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        // Row ids order attempts within one second; a success resets the count.
        auto stmt{ prepare(db, "SELECT COUNT(*) FROM login_attempts"
                               " WHERE address = ?1 AND success = 0 AND attempted_at > ?2"
                               " AND id > COALESCE((SELECT MAX(id) FROM login_attempts"
                               " WHERE address = ?1 AND success = 1), 0);") };
        bindText(db, stmt.get(), 1, key, "storage: bind address failed");
        bindInt64(db, stmt.get(), 2, portalgate::core::toUnixSeconds(since), "storage: bind since failed");
        if (!stepRow(db, stmt.get(), "storage: count failures failed"))
        {
            return 0U;
        }
        return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

    [[nodiscard]] std::optional<portalgate::core::TimePoint> lockedUntil(std::string_view address) override
    {
        const auto key{ requireAddress(address) };
        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        auto stmt{ prepare(db, "SELECT locked_until FROM address_lockouts WHERE address = ? AND locked_until > ?;") };
        bindText(db, stmt.get(), 1, key, "storage: bind address failed");
        bindInt64(db, stmt.get(), 2, portalgate::core::toUnixSeconds(m_now()), "storage: bind now failed");
        if (!stepRow(db, stmt.get(), "storage: select lockout failed"))
        {
            return std::nullopt;
        }
        return portalgate::core::fromUnixSeconds(sqlite3_column_int64(stmt.get(), 0));
    }

    void lock(std::string_view address, portalgate::core::TimePoint until, std::size_t failures) override
    {
        const auto key{ requireAddress(address) };
        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        auto stmt{ prepare(db, "INSERT INTO address_lockouts(address, locked_until, failures) VALUES (?, ?, ?)"
                               " ON CONFLICT(address) DO UPDATE SET locked_until = excluded.locked_until,"
                               " failures = excluded.failures;") };
        bindText(db, stmt.get(), 1, key, "storage: bind address failed");
        bindInt64(db, stmt.get(), 2, portalgate::core::toUnixSeconds(until), "storage: bind locked_until failed");
        bindInt64(db, stmt.get(), 3, static_cast<std::int64_t>(failures), "storage: bind failures failed");
        stepDone(db, stmt.get(), "storage: upsert lockout failed");
    }

    [[nodiscard]] std::vector<LoginAttempt> attempts(std::size_t limit, std::size_t offset) override
    {
        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        auto stmt{ prepare(db, "SELECT address, username, success, attempted_at, user_agent FROM login_attempts"
                               " ORDER BY id DESC LIMIT ? OFFSET ?;") };
        bindInt64(db, stmt.get(), 1, static_cast<std::int64_t>(limit), "storage: bind limit failed");
        bindInt64(db, stmt.get(), 2, static_cast<std::int64_t>(offset), "storage: bind offset failed");

        std::vector<LoginAttempt> out;
        while (stepRow(db, stmt.get(), "storage: list login attempts failed"))
        {
            LoginAttempt attempt{};
            attempt.address = columnText(stmt.get(), 0);
            attempt.username = columnText(stmt.get(), 1);
            attempt.success = sqlite3_column_int(stmt.get(), 2) != 0;
            attempt.attemptedAt = portalgate::core::fromUnixSeconds(sqlite3_column_int64(stmt.get(), 3));
            attempt.userAgent = columnText(stmt.get(), 4);
            out.push_back(std::move(attempt));
        }
        return out;
    }

    std::size_t prune(portalgate::core::TimePoint before) override
    {
        const auto lease{ m_pool.acquire() };
        sqlite3* db{ lease->get() };

        auto attemptsStmt{ prepare(db, "DELETE FROM login_attempts WHERE attempted_at < ?;") };
        bindInt64(db, attemptsStmt.get(), 1, portalgate::core::toUnixSeconds(before), "storage: bind before failed");
        stepDone(db, attemptsStmt.get(), "storage: prune login attempts failed");
        auto removed{ static_cast<std::size_t>(sqlite3_changes(db)) };

        auto lockoutsStmt{ prepare(db, "DELETE FROM address_lockouts WHERE locked_until <= ?;") };
        bindInt64(db, lockoutsStmt.get(), 1, portalgate::core::toUnixSeconds(m_now()), "storage: bind now failed");
        stepDone(db, lockoutsStmt.get(), "storage: prune lockouts failed");
        removed += static_cast<std::size_t>(sqlite3_changes(db));

        if (removed > 0U)
        {
            m_log->debug("pruned {} login audit row(s)", removed);
        }
        return removed;
    }

private:
    portalgate::core::NowProvider m_now;
    ConnectionPool m_pool;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace

std::unique_ptr<portalgate::storage::ILoginAuditStore>
makeSqliteLoginAuditStore(const std::filesystem::path& dbPath, SqliteStoreOptions options, portalgate::core::NowProvider now)
{
    prepareDatabaseDirectory(dbPath);
    return std::make_unique<SqliteLoginAuditStore>(dbPath, options, std::move(now));
}

} // namespace portalgate::storage::sqlite
