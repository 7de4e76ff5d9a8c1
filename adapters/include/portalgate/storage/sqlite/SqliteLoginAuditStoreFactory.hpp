#ifndef INCLUDE_PORTALGATE_STORAGE_SQLITE_SQLITELOGINAUDITSTOREFACTORY_HPP
#define INCLUDE_PORTALGATE_STORAGE_SQLITE_SQLITELOGINAUDITSTOREFACTORY_HPP

#include "portalgate/core/Session.hpp"
#include "portalgate/storage/ILoginAuditStore.hpp"
#include "portalgate/storage/sqlite/SqliteSessionStoreFactory.hpp"
#include <filesystem>
#include <memory>

namespace portalgate::storage::sqlite
{

// Opens the same database file as the session store; either may create the schema.
// Throws StoreIoError when the file cannot be opened or initialized.
[[nodiscard]] std::unique_ptr<portalgate::storage::ILoginAuditStore>
makeSqliteLoginAuditStore(const std::filesystem::path& dbPath, SqliteStoreOptions options = {},
                          portalgate::core::NowProvider now = portalgate::core::systemNow);

} // namespace portalgate::storage::sqlite

#endif // INCLUDE_PORTALGATE_STORAGE_SQLITE_SQLITELOGINAUDITSTOREFACTORY_HPP
