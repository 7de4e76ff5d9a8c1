#include "AuthApi.hpp"
#include "AuthHttpServer.hpp"
#include "portalgate/app/CommonOptions.hpp"
#include "portalgate/core/AuthService.hpp"
#include "portalgate/crypto/providers/OpenSslProviderFactory.hpp"
#include "portalgate/log/Loggers.hpp"
#include "portalgate/storage/sqlite/SqliteLoginAuditStoreFactory.hpp"
#include "portalgate/storage/sqlite/SqliteSessionStoreFactory.hpp"
#include <CLI/CLI.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <variant>

namespace
{

constexpr std::chrono::seconds g_kReadTimeout{ 30 };

constexpr unsigned g_kSecondsPerDay{ 24U * 3600U };

// Demotes expired rows and trims the login history every `interval` until the io_context stops.
void scheduleSweep(boost::asio::steady_timer& timer, std::chrono::seconds interval,
                   portalgate::core::AuthService& service, spdlog::logger& log)
{
    timer.expires_after(interval);
    timer.async_wait(
        [&timer, interval, &service, &log](const boost::system::error_code& ec)
        {
            if (ec)
            {
                return;
            }
            const auto swept{ service.sweepExpired() };
            if (const auto* count{ std::get_if<std::size_t>(&swept) }; count != nullptr && *count > 0U)
            {
                log.info("demoted {} expired sessions", *count);
            }
            const auto pruned{ service.pruneLoginHistory() };
            if (const auto* count{ std::get_if<std::size_t>(&pruned) }; count != nullptr && *count > 0U)
            {
                log.info("pruned {} login history rows", *count);
            }
            scheduleSweep(timer, interval, service, log);
        });
}

} // namespace

int main(int argc, char** argv)
{
    CLI::App app{ "portalgate-auth: captive-portal authentication API" };

    portalgate::app::CommonOptions common{};
    portalgate::app::addCommonOptions(app, common);

    std::string host{ "0.0.0.0" };
    std::uint16_t port{ 8080 };
    portalgate::core::Credentials credentials{ "addyya", "sf123123" };
    unsigned sessionTtl{ 3600U };
    std::size_t maxAttempts{ 5U };
    unsigned attemptWindow{ 3600U };
    unsigned lockout{ 300U };
    unsigned sweepInterval{ 0U };
    unsigned historyDays{ 7U };

    app.add_option("--host", host, "Listen address")->capture_default_str();
    app.add_option("--port", port, "Listen port")->capture_default_str();
    app.add_option("--username", credentials.username, "Shared portal username")->capture_default_str();
    app.add_option("--password", credentials.password, "Shared portal password")->envname("PGATE_AUTH_PASSWORD");
    app.add_option("--session-ttl", sessionTtl, "Seconds a login stays valid")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--max-attempts", maxAttempts, "Failed logins per window before lockout, 0 disables")
        ->capture_default_str();
    app.add_option("--attempt-window", attemptWindow, "Seconds failed logins are remembered")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--lockout", lockout, "Seconds an address stays locked out")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--sweep-interval", sweepInterval, "Seconds between expired-session sweeps, 0 disables")
        ->capture_default_str();
    app.add_option("--login-history-days", historyDays, "Days login attempts are kept for /api/admin/logs")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    try
    {
        portalgate::log::setupLogging(portalgate::app::toLogOptions(common));
        auto log{ portalgate::log::logger("auth") };

        auto store{ portalgate::storage::sqlite::makeSqliteSessionStore(common.dbPath,
                                                                        portalgate::app::toStoreOptions(common)) };
        auto audit{ portalgate::storage::sqlite::makeSqliteLoginAuditStore(common.dbPath,
                                                                           portalgate::app::toStoreOptions(common)) };
        auto crypto{ portalgate::crypto::providers::makeOpenSslCryptoProvider() };

        portalgate::core::AuthOptions authOptions{};
        authOptions.sessionTtl = std::chrono::seconds{ sessionTtl };
        authOptions.throttle.maxFailures = maxAttempts;
        authOptions.throttle.window = std::chrono::seconds{ attemptWindow };
        authOptions.throttle.lockout = std::chrono::seconds{ lockout };
        authOptions.throttle.retention = std::chrono::seconds{ historyDays * g_kSecondsPerDay };
        portalgate::core::AuthService service{ *store, *audit, *crypto, credentials, authOptions };
        portalgate::auth::AuthApi api{ service };

        const auto threads{ portalgate::app::effectiveThreads(common) };
        boost::asio::io_context ioc{ static_cast<int>(threads) };
        portalgate::auth::AuthHttpServer server{ ioc, api, g_kReadTimeout };
        server.listen(host, port);
        server.start();

        boost::asio::steady_timer sweepTimer{ ioc };
        if (sweepInterval > 0U)
        {
            scheduleSweep(sweepTimer, std::chrono::seconds{ sweepInterval }, service, *log);
        }

        boost::asio::signal_set signals{ ioc, SIGINT, SIGTERM };
        signals.async_wait(
            [&](const boost::system::error_code& ec, int signal)
            {
                if (ec)
                {
                    return;
                }
                log->info("signal {} received, shutting down", signal);
                server.stop();
                sweepTimer.cancel();
                ioc.stop();
            });

        log->info("database {}, session ttl {}s, {} threads", common.dbPath, sessionTtl, threads);
        portalgate::app::runIoContext(ioc, threads);
        log->info("auth server stopped");
        return 0;
    }
    catch (const std::exception& e)
    {
        portalgate::log::logger("auth")->critical("fatal: {}", e.what());
        return 1;
    }
}
