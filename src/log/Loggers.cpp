#include "portalgate/log/Loggers.hpp"

#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <system_error>
#include <vector>

namespace portalgate::log
{
namespace
{

constexpr const char* g_kPattern{ "%Y-%m-%d %H:%M:%S.%e [%l] [%n] %v" };

std::mutex& registryMutex()
{
    static std::mutex mtx;
    return mtx;
}

} // namespace

void setupLogging(const LogOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (options.file.has_value())
    {
        std::error_code ec{};
        const auto parent{ options.file->parent_path() };
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file->string(), false));
    }

    auto root{ std::make_shared<spdlog::logger>("portalgate", sinks.begin(), sinks.end()) };
    root->set_pattern(g_kPattern);
    root->set_level(spdlog::level::from_str(options.level));
    root->flush_on(spdlog::level::warn);

    const std::lock_guard<std::mutex> lock{ registryMutex() };
    spdlog::drop_all();
    spdlog::set_default_logger(root);
}

std::shared_ptr<spdlog::logger> logger(std::string_view name)
{
    const std::string key{ name };

    const std::lock_guard<std::mutex> lock{ registryMutex() };
    if (auto existing{ spdlog::get(key) }; existing)
    {
        return existing;
    }

    auto created{ spdlog::default_logger()->clone(key) };
    spdlog::register_logger(created);
    return created;
}

} // namespace portalgate::log
