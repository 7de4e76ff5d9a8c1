#include "ProxyServer.hpp"
#include "portalgate/app/CommonOptions.hpp"
#include "portalgate/core/PolicyEngine.hpp"
#include "portalgate/log/Loggers.hpp"
#include "portalgate/storage/sqlite/SqliteSessionStoreFactory.hpp"
#include <CLI/CLI.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    CLI::App app{ "portalgate-proxy: captive-portal interception proxy" };

    portalgate::app::CommonOptions common{};
    portalgate::app::addCommonOptions(app, common);

    std::string host{ "0.0.0.0" };
    std::uint16_t port{ 8888 };
    std::vector<std::string> portalHosts{};
    portalgate::proxy::ProxyOptions options{};
    unsigned headTimeout{ 10U };
    unsigned connectTimeout{ 10U };
    unsigned idleTimeout{ 60U };

    app.add_option("--host", host, "Listen address")->capture_default_str();
    app.add_option("--port", port, "Listen port")->capture_default_str();
    app.add_option("--portal-url", options.portalUrl, "Login page unauthenticated devices are sent to")
        ->capture_default_str();
    app.add_option("--portal-host", portalHosts, "Host or host:port reachable without a session (repeatable)");
    app.add_option("--head-timeout", headTimeout, "Seconds allowed for the request head")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--connect-timeout", connectTimeout, "Seconds allowed for the upstream connect")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--idle-timeout", idleTimeout, "Seconds a relay may stay silent")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--max-head-bytes", options.maxHeadBytes, "Largest accepted request head")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    options.headTimeout = std::chrono::seconds{ headTimeout };
    options.connectTimeout = std::chrono::seconds{ connectTimeout };
    options.idleTimeout = std::chrono::seconds{ idleTimeout };

    try
    {
        portalgate::log::setupLogging(portalgate::app::toLogOptions(common));
        auto log{ portalgate::log::logger("proxy") };

        auto store{ portalgate::storage::sqlite::makeSqliteSessionStore(common.dbPath,
                                                                        portalgate::app::toStoreOptions(common)) };
        const portalgate::core::PolicyEngine policy{ *store, portalgate::core::PolicyOptions{ portalHosts } };

        const auto threads{ portalgate::app::effectiveThreads(common) };
        boost::asio::io_context ioc{ static_cast<int>(threads) };
        portalgate::proxy::ProxyServer server{ ioc, policy, *store, options, common.poolSize };
        server.listen(host, port);
        server.start();

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
                ioc.stop();
            });

        log->info("portal url {}, database {}, {} threads", options.portalUrl, common.dbPath, threads);
        portalgate::app::runIoContext(ioc, threads);
        log->info("proxy stopped");
        return 0;
    }
    catch (const std::exception& e)
    {
        portalgate::log::logger("proxy")->critical("fatal: {}", e.what());
        return 1;
    }
}
