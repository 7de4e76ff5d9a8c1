#ifndef INCLUDE_PORTALGATE_APP_COMMONOPTIONS_HPP
#define INCLUDE_PORTALGATE_APP_COMMONOPTIONS_HPP

#include "portalgate/log/Loggers.hpp"
#include "portalgate/storage/sqlite/SqliteSessionStoreFactory.hpp"
#include <CLI/CLI.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <string>

namespace portalgate::app
{

// Options both executables accept.
struct CommonOptions final
{
    std::string dbPath{ "wifi_auth.db" };
    std::string logLevel{ "info" };
    std::string logFile;
    std::size_t threads{ 0U };
    unsigned busyTimeoutMs{ 5000U };
    std::size_t poolSize{ 8U };
};

// Registers --db, --log-level, --log-file, --threads, --busy-timeout-ms, --pool-size and --config.
void addCommonOptions(CLI::App& app, CommonOptions& options);

[[nodiscard]] portalgate::log::LogOptions toLogOptions(const CommonOptions& options);

[[nodiscard]] portalgate::storage::sqlite::SqliteStoreOptions toStoreOptions(const CommonOptions& options) noexcept;

// Zero means one thread per hardware thread.
[[nodiscard]] std::size_t effectiveThreads(const CommonOptions& options) noexcept;

// Runs `ioc` on `threads` threads (the caller's included) until it stops.
void runIoContext(boost::asio::io_context& ioc, std::size_t threads);

} // namespace portalgate::app

#endif // INCLUDE_PORTALGATE_APP_COMMONOPTIONS_HPP
