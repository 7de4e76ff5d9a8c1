#ifndef INCLUDE_PORTALGATE_LOG_LOGGERS_HPP
#define INCLUDE_PORTALGATE_LOG_LOGGERS_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/logger.h>
#include <string>
#include <string_view>

namespace portalgate::log
{

struct LogOptions final
{
    std::string level{ "info" };
    std::optional<std::filesystem::path> file;
};

// Installs the process-wide sinks (colored stdout, optional file). Loggers created later
// through logger() share these sinks. Throws spdlog::spdlog_ex when the file cannot be opened.
void setupLogging(const LogOptions& options);

// Returns the named component logger, creating it from the default logger on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger(std::string_view name);

} // namespace portalgate::log

#endif // INCLUDE_PORTALGATE_LOG_LOGGERS_HPP
