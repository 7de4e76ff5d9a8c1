#ifndef INCLUDE_PORTALGATE_STORAGE_SQLITE_SQLITESESSIONSTOREFACTORY_HPP
#define INCLUDE_PORTALGATE_STORAGE_SQLITE_SQLITESESSIONSTOREFACTORY_HPP

#include "portalgate/core/Session.hpp"
#include "portalgate/storage/ISessionStore.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>

namespace portalgate::storage::sqlite
{

struct SqliteStoreOptions final
{
    // Connections kept open for concurrent callers; one is borrowed per operation.
    std::size_t poolSize{ 8U };
    // Upper bound a writer waits for a conflicting writer before StoreIoError.
    std::chrono::milliseconds busyTimeout{ 5000 };
};

// Opens (creating if needed) the database file and its schema.
// Throws StoreIoError when the file cannot be opened or initialized.
[[nodiscard]] std::unique_ptr<portalgate::storage::ISessionStore>
makeSqliteSessionStore(const std::filesystem::path& dbPath, SqliteStoreOptions options = {},
                       portalgate::core::NowProvider now = portalgate::core::systemNow);

} // namespace portalgate::storage::sqlite

#endif // INCLUDE_PORTALGATE_STORAGE_SQLITE_SQLITESESSIONSTOREFACTORY_HPP
