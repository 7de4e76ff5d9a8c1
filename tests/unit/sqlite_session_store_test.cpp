#include "portalgate/storage/sqlite/SqliteSessionStoreFactory.hpp"

#include "portalgate/storage/StorageErrors.hpp"
#include "test_utils/TestUtils.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <stdexcept>
#include <string>

namespace
{

using portalgate::core::Duration;
using portalgate::core::SessionState;
using portalgate::test_utils::ManualClock;

struct StoreFixture
{
    std::filesystem::path dir;
    ManualClock clock{};
    std::unique_ptr<portalgate::storage::ISessionStore> store;

    explicit StoreFixture(std::string_view prefix) : dir(portalgate::test_utils::makeSecureTempDir(prefix))
    {
        if (!dir.empty())
        {
            store = portalgate::storage::sqlite::makeSqliteSessionStore(dir / "sessions.db", {}, clock.provider());
        }
    }

    StoreFixture(const StoreFixture&) = delete;
    StoreFixture& operator=(const StoreFixture&) = delete;
    StoreFixture(StoreFixture&&) = delete;
    StoreFixture& operator=(StoreFixture&&) = delete;

    ~StoreFixture()
    {
        store.reset();
        std::error_code ec{};
        std::filesystem::remove_all(dir, ec);
    }
};

[[nodiscard]] int countRows(const std::filesystem::path& dbPath)
{
    sqlite3* db{ nullptr };
    if (sqlite3_open_v2(dbPath.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK)
    {
        sqlite3_close_v2(db);
        return -1;
    }
    sqlite3_stmt* stmt{ nullptr };
    int count{ -1 };
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM device_sessions;", -1, &stmt, nullptr) == SQLITE_OK &&
        sqlite3_step(stmt) == SQLITE_ROW)
    {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    sqlite3_close_v2(db);
    return count;
}

[[nodiscard]] std::string readJournalMode(const std::filesystem::path& dbPath)
{
    sqlite3* db{ nullptr };
    std::string mode{};
    if (sqlite3_open_v2(dbPath.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr) == SQLITE_OK)
    {
        sqlite3_stmt* stmt{ nullptr };
        if (sqlite3_prepare_v2(db, "PRAGMA journal_mode;", -1, &stmt, nullptr) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_ROW)
        {
            mode = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        }
        sqlite3_finalize(stmt);
    }
    sqlite3_close_v2(db);
    return mode;
}

} // namespace

TEST(SqliteSessionStore, UnknownAddressIsUnauthenticatedAndCreatesNoRow)
{
    StoreFixture f{ "store_unknown_" };
    ASSERT_TRUE(f.store);

    const auto view{ f.store->get("10.0.0.5") };
    EXPECT_EQ(view.state, SessionState::Unauthenticated);
    EXPECT_FALSE(view.token.has_value());
    EXPECT_EQ(view.address, "10.0.0.5");
    EXPECT_EQ(countRows(f.dir / "sessions.db"), 0);
}

TEST(SqliteSessionStore, PutThenGetIsAuthenticatedUntilExpiry)
{
    StoreFixture f{ "store_put_" };
    ASSERT_TRUE(f.store);

    const auto createdAt{ f.clock.now() };
    f.store->put("10.0.0.5", "tok-1", Duration{ 3600 });

    auto view{ f.store->get("10.0.0.5") };
    ASSERT_TRUE(view.isAuthenticated());
    EXPECT_EQ(view.token, std::optional<std::string>{ "tok-1" });
    EXPECT_EQ(view.createdAt, createdAt);
    EXPECT_EQ(view.expiresAt, createdAt + Duration{ 3600 });
    EXPECT_EQ(view.lastSeenAt, createdAt);

    f.clock.advance(Duration{ 3599 });
    EXPECT_TRUE(f.store->get("10.0.0.5").isAuthenticated());

    f.clock.advance(Duration{ 1 });
    view = f.store->get("10.0.0.5");
    EXPECT_EQ(view.state, SessionState::Unauthenticated);
    EXPECT_FALSE(view.token.has_value());
}

TEST(SqliteSessionStore, ExpiredRowIsDemotedInPlaceByRead)
{
    StoreFixture f{ "store_demote_" };
    ASSERT_TRUE(f.store);

    f.store->put("10.0.0.7", "tok", Duration{ 10 });
    f.clock.advance(Duration{ 11 });
    EXPECT_FALSE(f.store->get("10.0.0.7").isAuthenticated());

    // The row survives as an unauthenticated record for the admin list.
    EXPECT_EQ(countRows(f.dir / "sessions.db"), 1);
    const auto listed{ f.store->list(10U) };
    ASSERT_EQ(listed.size(), 1U);
    EXPECT_EQ(listed[0].state, SessionState::Unauthenticated);
    EXPECT_FALSE(listed[0].token.has_value());
}

TEST(SqliteSessionStore, ReauthenticationOverwritesInPlace)
{
    StoreFixture f{ "store_overwrite_" };
    ASSERT_TRUE(f.store);

    f.store->put("10.0.0.5", "first", Duration{ 60 });
    f.clock.advance(Duration{ 30 });
    f.store->put("10.0.0.5", "second", Duration{ 60 });

    const auto view{ f.store->get("10.0.0.5") };
    EXPECT_EQ(view.token, std::optional<std::string>{ "second" });
    EXPECT_EQ(view.expiresAt, f.clock.now() + Duration{ 60 });
    EXPECT_EQ(countRows(f.dir / "sessions.db"), 1);
}

TEST(SqliteSessionStore, RemoveIsIdempotent)
{
    StoreFixture f{ "store_remove_" };
    ASSERT_TRUE(f.store);

    f.store->put("10.0.0.5", "tok", Duration{ 60 });
    f.store->remove("10.0.0.5");
    EXPECT_FALSE(f.store->get("10.0.0.5").isAuthenticated());
    EXPECT_NO_THROW(f.store->remove("10.0.0.5"));
    EXPECT_NO_THROW(f.store->remove("10.0.0.99"));
    EXPECT_EQ(countRows(f.dir / "sessions.db"), 0);
}

TEST(SqliteSessionStore, RejectsMalformedInput)
{
    StoreFixture f{ "store_invalid_" };
    ASSERT_TRUE(f.store);

    EXPECT_THROW((void)f.store->get("not-an-ip"), std::invalid_argument);
    EXPECT_THROW((void)f.store->get(""), std::invalid_argument);
    EXPECT_THROW(f.store->put("10.0.0.5", "", Duration{ 60 }), std::invalid_argument);
    EXPECT_THROW(f.store->put("10.0.0.5", "tok", Duration{ 0 }), std::invalid_argument);
    EXPECT_THROW(f.store->put("10.0.0.5", "tok", Duration{ -5 }), std::invalid_argument);
    EXPECT_THROW(f.store->remove("10.0.0.300"), std::invalid_argument);
    EXPECT_EQ(countRows(f.dir / "sessions.db"), 0);
}

TEST(SqliteSessionStore, MappedIpv6AndIpv4ShareOneRecord)
{
    StoreFixture f{ "store_mapped_" };
    ASSERT_TRUE(f.store);

    f.store->put("::ffff:10.0.0.5", "tok", Duration{ 60 });
    const auto view{ f.store->get("10.0.0.5") };
    EXPECT_TRUE(view.isAuthenticated());
    EXPECT_EQ(view.address, "10.0.0.5");
}

TEST(SqliteSessionStore, UserAgentIsRecordedForExistingRowsOnly)
{
    StoreFixture f{ "store_ua_" };
    ASSERT_TRUE(f.store);

    f.store->setUserAgent("10.0.0.8", "curl/8.0");
    EXPECT_EQ(countRows(f.dir / "sessions.db"), 0);

    f.store->put("10.0.0.8", "tok", Duration{ 600 });
    EXPECT_TRUE(f.store->get("10.0.0.8").userAgent.empty());
    f.store->setUserAgent("::ffff:10.0.0.8", "Mozilla/5.0");
    EXPECT_EQ(f.store->get("10.0.0.8").userAgent, "Mozilla/5.0");
    EXPECT_EQ(f.store->list(10U).front().userAgent, "Mozilla/5.0");
}

TEST(SqliteSessionStore, OlderDatabaseGainsUserAgentColumn)
{
    const auto dir{ portalgate::test_utils::makeSecureTempDir("store_migrate_") };
    if (dir.empty())
    {
        GTEST_SKIP() << "cannot create temp dir";
    }
    const auto dbPath{ dir / "sessions.db" };
    {
        sqlite3* db{ nullptr };
        ASSERT_EQ(sqlite3_open(dbPath.string().c_str(), &db), SQLITE_OK);
        const int rc{ sqlite3_exec(db,
                                   "CREATE TABLE device_sessions ("
                                   " address TEXT PRIMARY KEY NOT NULL,"
                                   " state INTEGER NOT NULL CHECK(state IN (0, 1)),"
                                   " token TEXT,"
                                   " created_at INTEGER NOT NULL,"
                                   " expires_at INTEGER NOT NULL,"
                                   " last_seen_at INTEGER NOT NULL);"
                                   "INSERT INTO device_sessions VALUES ('10.0.0.3', 1, 'tok', 1700000000, 1700003600,"
                                   " 1700000000);",
                                   nullptr, nullptr, nullptr) };
        sqlite3_close_v2(db);
        ASSERT_EQ(rc, SQLITE_OK);
    }

    {
        ManualClock clock{};
        const auto store{ portalgate::storage::sqlite::makeSqliteSessionStore(dbPath, {}, clock.provider()) };
        const auto view{ store->get("10.0.0.3") };
        EXPECT_TRUE(view.isAuthenticated());
        EXPECT_TRUE(view.userAgent.empty());
        store->setUserAgent("10.0.0.3", "agent/1");
        EXPECT_EQ(store->get("10.0.0.3").userAgent, "agent/1");
    }

    std::error_code ec{};
    std::filesystem::remove_all(dir, ec);
}

TEST(SqliteSessionStore, TouchRefreshesLastSeenButNeverCreates)
{
    StoreFixture f{ "store_touch_" };
    ASSERT_TRUE(f.store);

    f.store->touch("10.0.0.8");
    EXPECT_EQ(countRows(f.dir / "sessions.db"), 0);

    f.store->put("10.0.0.8", "tok", Duration{ 600 });
    f.clock.advance(Duration{ 42 });
    f.store->touch("10.0.0.8");

    const auto view{ f.store->get("10.0.0.8") };
    EXPECT_EQ(view.lastSeenAt, f.clock.now());
    EXPECT_EQ(view.expiresAt, f.clock.now() - Duration{ 42 } + Duration{ 600 });
}

TEST(SqliteSessionStore, ListOrdersByLastSeenAndHonoursLimit)
{
    StoreFixture f{ "store_list_" };
    ASSERT_TRUE(f.store);

    f.store->put("10.0.0.1", "a", Duration{ 600 });
    f.clock.advance(Duration{ 1 });
    f.store->put("10.0.0.2", "b", Duration{ 600 });
    f.clock.advance(Duration{ 1 });
    f.store->put("10.0.0.3", "c", Duration{ 600 });
    f.clock.advance(Duration{ 1 });
    f.store->touch("10.0.0.1");

    const auto all{ f.store->list(10U) };
    ASSERT_EQ(all.size(), 3U);
    EXPECT_EQ(all[0].address, "10.0.0.1");
    EXPECT_EQ(all[1].address, "10.0.0.3");
    EXPECT_EQ(all[2].address, "10.0.0.2");

    EXPECT_EQ(f.store->list(2U).size(), 2U);
}

TEST(SqliteSessionStore, SweepDemotesOnlyExpiredRows)
{
    StoreFixture f{ "store_sweep_" };
    ASSERT_TRUE(f.store);

    f.store->put("10.0.0.1", "a", Duration{ 10 });
    f.store->put("10.0.0.2", "b", Duration{ 100 });
    f.clock.advance(Duration{ 50 });

    EXPECT_EQ(f.store->sweepExpired(), 1U);
    EXPECT_EQ(f.store->sweepExpired(), 0U);
    EXPECT_FALSE(f.store->get("10.0.0.1").isAuthenticated());
    EXPECT_TRUE(f.store->get("10.0.0.2").isAuthenticated());
}

TEST(SqliteSessionStore, UsesWriteAheadLog)
{
    StoreFixture f{ "store_wal_" };
    ASSERT_TRUE(f.store);

    EXPECT_EQ(readJournalMode(f.dir / "sessions.db"), "wal");
}

TEST(SqliteSessionStore, SessionsSurviveReopen)
{
    const auto dir{ portalgate::test_utils::makeSecureTempDir("store_reopen_") };
    ASSERT_FALSE(dir.empty());
    ManualClock clock{};

    {
        auto store{ portalgate::storage::sqlite::makeSqliteSessionStore(dir / "s.db", {}, clock.provider()) };
        store->put("10.0.0.5", "persisted", Duration{ 3600 });
    }
    {
        auto store{ portalgate::storage::sqlite::makeSqliteSessionStore(dir / "s.db", {}, clock.provider()) };
        const auto view{ store->get("10.0.0.5") };
        EXPECT_TRUE(view.isAuthenticated());
        EXPECT_EQ(view.token, std::optional<std::string>{ "persisted" });
    }

    std::filesystem::remove_all(dir);
}

TEST(SqliteSessionStore, CreatesMissingParentDirectory)
{
    const auto dir{ portalgate::test_utils::makeSecureTempDir("store_parent_") };
    ASSERT_FALSE(dir.empty());

    const auto nested{ dir / "a" / "b" / "sessions.db" };
    auto store{ portalgate::storage::sqlite::makeSqliteSessionStore(nested) };
    EXPECT_TRUE(std::filesystem::exists(nested));

    store.reset();
    std::filesystem::remove_all(dir);
}

TEST(SqliteSessionStore, UnopenableDatabaseRaisesStoreIoError)
{
    const auto dir{ portalgate::test_utils::makeSecureTempDir("store_badpath_") };
    ASSERT_FALSE(dir.empty());

    // A directory cannot be opened as a database file.
    EXPECT_THROW((void)portalgate::storage::sqlite::makeSqliteSessionStore(dir), portalgate::storage::StoreIoError);

    std::filesystem::remove_all(dir);
}

TEST(SqliteSessionStore, ZeroPoolSizeIsRejected)
{
    const auto dir{ portalgate::test_utils::makeSecureTempDir("store_pool_") };
    ASSERT_FALSE(dir.empty());

    portalgate::storage::sqlite::SqliteStoreOptions options{};
    options.poolSize = 0U;
    EXPECT_THROW((void)portalgate::storage::sqlite::makeSqliteSessionStore(dir / "s.db", options),
                 std::invalid_argument);

    std::filesystem::remove_all(dir);
}
