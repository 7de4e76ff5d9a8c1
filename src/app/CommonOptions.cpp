#include "portalgate/app/CommonOptions.hpp"

#include <chrono>
#include <thread>
#include <vector>

namespace portalgate::app
{

void addCommonOptions(CLI::App& app, CommonOptions& options)
{
    app.set_config("--config", "", "Read options from an INI or TOML file");

    app.add_option("--db", options.dbPath, "SQLite session database shared by proxy and auth server")
        ->capture_default_str();
    app.add_option("--log-level", options.logLevel, "trace, debug, info, warn, error, critical or off")
        ->check(CLI::IsMember({ "trace", "debug", "info", "warn", "error", "critical", "off" }))
        ->capture_default_str();
    app.add_option("--log-file", options.logFile, "Also append log lines to this file");
    app.add_option("--threads", options.threads, "I/O threads, 0 for one per hardware thread")
        ->capture_default_str();
    app.add_option("--busy-timeout-ms", options.busyTimeoutMs, "Longest wait for a conflicting SQLite writer")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--pool-size", options.poolSize, "Pooled SQLite connections")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
}

portalgate::log::LogOptions toLogOptions(const CommonOptions& options)
{
    portalgate::log::LogOptions out{};
    out.level = options.logLevel;
    if (!options.logFile.empty())
    {
        out.file = std::filesystem::path{ options.logFile };
    }
    return out;
}

portalgate::storage::sqlite::SqliteStoreOptions toStoreOptions(const CommonOptions& options) noexcept
{
    portalgate::storage::sqlite::SqliteStoreOptions out{};
    out.poolSize = options.poolSize;
    out.busyTimeout = std::chrono::milliseconds{ options.busyTimeoutMs };
    return out;
}

std::size_t effectiveThreads(const CommonOptions& options) noexcept
{
    if (options.threads != 0U)
    {
        return options.threads;
    }
    const auto hw{ static_cast<std::size_t>(std::thread::hardware_concurrency()) };
    return (hw == 0U) ? 1U : hw;
}

void runIoContext(boost::asio::io_context& ioc, std::size_t threads)
{
    std::vector<std::thread> workers{};
    workers.reserve(threads > 0U ? threads - 1U : 0U);
    for (std::size_t i{ 1U }; i < threads; ++i)
    {
        workers.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();
    for (auto& worker : workers)
    {
        worker.join();
    }
}

} // namespace portalgate::app
