#include "ProxyServer.hpp"

#include "portalgate/core/PolicyEngine.hpp"
#include "portalgate/storage/sqlite/SqliteSessionStoreFactory.hpp"
#include "test_utils/TestUtils.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace
{

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

[[nodiscard]] portalgate::proxy::ProxyOptions harnessOptions()
{
    portalgate::proxy::ProxyOptions options{};
    options.portalUrl = "http://portal.test/api/auth/fallback";
    options.connectTimeout = std::chrono::seconds{ 2 };
    options.idleTimeout = std::chrono::seconds{ 5 };
    return options;
}

// Proxy on 127.0.0.1 with an ephemeral port, backed by a throwaway database.
class ProxyHarness
{
public:
    explicit ProxyHarness(std::string_view prefix, portalgate::proxy::ProxyOptions options = harnessOptions())
        : m_dir(portalgate::test_utils::makeSecureTempDir(prefix))
    {
        if (m_dir.empty())
        {
            return;
        }
        m_store = portalgate::storage::sqlite::makeSqliteSessionStore(m_dir / "proxy.db");
        m_policy = std::make_unique<portalgate::core::PolicyEngine>(*m_store);

        m_server = std::make_unique<portalgate::proxy::ProxyServer>(m_ioc, *m_policy, *m_store, options, 2U);
        m_server->listen("127.0.0.1", 0);
        m_server->start();
        m_thread = std::thread{ [this]() { m_ioc.run(); } };
    }

    ProxyHarness(const ProxyHarness&) = delete;
    ProxyHarness& operator=(const ProxyHarness&) = delete;
    ProxyHarness(ProxyHarness&&) = delete;
    ProxyHarness& operator=(ProxyHarness&&) = delete;

    ~ProxyHarness()
    {
        if (m_server)
        {
            m_server->stop();
        }
        m_ioc.stop();
        if (m_thread.joinable())
        {
            m_thread.join();
        }
        m_server.reset();
        m_policy.reset();
        m_store.reset();
        std::error_code ec{};
        std::filesystem::remove_all(m_dir, ec);
    }

    [[nodiscard]] bool ready() const noexcept
    {
        return m_server != nullptr;
    }

    [[nodiscard]] portalgate::storage::ISessionStore& store()
    {
        return *m_store;
    }

    [[nodiscard]] tcp::endpoint endpoint() const
    {
        return m_server->localEndpoint();
    }

private:
    std::filesystem::path m_dir;
    asio::io_context m_ioc;
    std::unique_ptr<portalgate::storage::ISessionStore> m_store;
    std::unique_ptr<portalgate::core::PolicyEngine> m_policy;
    std::unique_ptr<portalgate::proxy::ProxyServer> m_server;
    std::thread m_thread;
};

// Sends `request` and returns everything the proxy writes until it closes the connection.
[[nodiscard]] std::string exchange(const tcp::endpoint& proxy, const std::string& request)
{
    asio::io_context ioc;
    tcp::socket socket{ ioc };
    socket.connect(proxy);
    asio::write(socket, asio::buffer(request));

    std::string response{};
    boost::system::error_code ec{};
    asio::read(socket, asio::dynamic_buffer(response), ec);
    return response;
}

// Collects what the proxy sends until it closes the connection; nullopt if it is still open
// after `limit`.
[[nodiscard]] std::optional<std::string> readUntilClosed(asio::io_context& ioc, tcp::socket& socket,
                                                         std::chrono::seconds limit)
{
    std::string data{};
    bool closed{ false };
    asio::async_read(socket, asio::dynamic_buffer(data),
                     [&closed](const boost::system::error_code&, std::size_t) { closed = true; });
    ioc.restart();
    ioc.run_for(limit);
    if (closed)
    {
        return data;
    }

    boost::system::error_code ec{};
    socket.close(ec);
    ioc.restart();
    ioc.run();
    return std::nullopt;
}

[[nodiscard]] std::uint16_t unusedPort()
{
    asio::io_context ioc;
    tcp::acceptor acceptor{ ioc, tcp::endpoint{ asio::ip::make_address("127.0.0.1"), 0 } };
    const auto port{ acceptor.local_endpoint().port() };
    acceptor.close();
    return port;
}

} // namespace

TEST(ProxyServer, UnauthenticatedPlainRequestIsRedirectedToPortal)
{
    ProxyHarness proxy{ "proxy_redirect_" };
    ASSERT_TRUE(proxy.ready());

    const auto response{ exchange(proxy.endpoint(),
                                  "GET http://example.com/ HTTP/1.1\r\nHost: example.com\r\n\r\n") };

    EXPECT_EQ(response.rfind("HTTP/1.1 511 ", 0), 0U);
    EXPECT_NE(response.find("Location: http://portal.test/api/auth/fallback?client_ip=127.0.0.1\r\n"),
              std::string::npos);
    EXPECT_NE(response.find("Connection: close"), std::string::npos);
}

TEST(ProxyServer, ConnectivityProbeGetsFoundRedirect)
{
    ProxyHarness proxy{ "proxy_probe_" };
    ASSERT_TRUE(proxy.ready());

    const auto response{ exchange(proxy.endpoint(),
                                  "GET /hotspot-detect.html HTTP/1.1\r\nHost: captive.apple.com\r\n\r\n") };

    EXPECT_EQ(response.rfind("HTTP/1.1 302 ", 0), 0U);
    EXPECT_NE(response.find("X-Login-URL: http://portal.test/api/auth/fallback?client_ip=127.0.0.1"),
              std::string::npos);
}

TEST(ProxyServer, UnauthenticatedTunnelIsClosedWithoutResponse)
{
    ProxyHarness proxy{ "proxy_tunnel_reject_" };
    ASSERT_TRUE(proxy.ready());

    const auto response{ exchange(proxy.endpoint(), "CONNECT example.com:443 HTTP/1.1\r\nHost: example.com:443\r\n\r\n") };
    EXPECT_TRUE(response.empty());
}

TEST(ProxyServer, MalformedHeadIsClosed)
{
    ProxyHarness proxy{ "proxy_malformed_" };
    ASSERT_TRUE(proxy.ready());

    EXPECT_TRUE(exchange(proxy.endpoint(), "NOT A REQUEST\r\n\r\n").empty());
}

TEST(ProxyServer, AuthenticatedRequestIsForwardedUnmodified)
{
    ProxyHarness proxy{ "proxy_forward_" };
    ASSERT_TRUE(proxy.ready());
    proxy.store().put("127.0.0.1", "token", portalgate::core::Duration{ 3600 });

    asio::io_context upstreamIoc;
    tcp::acceptor upstream{ upstreamIoc, tcp::endpoint{ asio::ip::make_address("127.0.0.1"), 0 } };
    const auto port{ upstream.local_endpoint().port() };

    auto received{ std::async(std::launch::async,
                              [&upstream]()
                              {
                                  tcp::socket peer{ upstream.get_executor() };
                                  upstream.accept(peer);
                                  std::string head{};
                                  asio::read_until(peer, asio::dynamic_buffer(head), "\r\n\r\n");
                                  const std::string reply{
                                      "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok"
                                  };
                                  asio::write(peer, asio::buffer(reply));
                                  boost::system::error_code ec{};
                                  peer.shutdown(tcp::socket::shutdown_both, ec);
                                  peer.close(ec);
                                  return head;
                              }) };

    const std::string authority{ "127.0.0.1:" + std::to_string(port) };
    const std::string request{ "GET http://" + authority + "/hello?x=1 HTTP/1.1\r\nHost: " + authority +
                               "\r\nX-Custom: kept\r\nConnection: close\r\n\r\n" };
    const auto response{ exchange(proxy.endpoint(), request) };

    ASSERT_EQ(received.wait_for(std::chrono::seconds{ 10 }), std::future_status::ready);
    EXPECT_EQ(received.get(), request);
    EXPECT_EQ(response, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok");
}

TEST(ProxyServer, AuthenticatedTunnelRelaysBothDirections)
{
    ProxyHarness proxy{ "proxy_tunnel_" };
    ASSERT_TRUE(proxy.ready());
    proxy.store().put("127.0.0.1", "token", portalgate::core::Duration{ 3600 });

    asio::io_context upstreamIoc;
    tcp::acceptor upstream{ upstreamIoc, tcp::endpoint{ asio::ip::make_address("127.0.0.1"), 0 } };
    const auto port{ upstream.local_endpoint().port() };

    auto echoed{ std::async(std::launch::async,
                            [&upstream]()
                            {
                                tcp::socket peer{ upstream.get_executor() };
                                upstream.accept(peer);
                                std::string data(4U, '\0');
                                asio::read(peer, asio::buffer(data));
                                asio::write(peer, asio::buffer(data));
                                return data;
                            }) };

    asio::io_context ioc;
    tcp::socket client{ ioc };
    client.connect(proxy.endpoint());
    const std::string authority{ "127.0.0.1:" + std::to_string(port) };
    asio::write(client, asio::buffer("CONNECT " + authority + " HTTP/1.1\r\nHost: " + authority + "\r\n\r\n"));

    std::string established{};
    asio::read_until(client, asio::dynamic_buffer(established), "\r\n\r\n");
    EXPECT_EQ(established, "HTTP/1.1 200 Connection Established\r\n\r\n");

    asio::write(client, asio::buffer(std::string{ "ping" }));
    std::string reply(4U, '\0');
    asio::read(client, asio::buffer(reply));
    EXPECT_EQ(reply, "ping");

    ASSERT_EQ(echoed.wait_for(std::chrono::seconds{ 10 }), std::future_status::ready);
    EXPECT_EQ(echoed.get(), "ping");
}

TEST(ProxyServer, UnreachableUpstreamYieldsBadGateway)
{
    ProxyHarness proxy{ "proxy_502_" };
    ASSERT_TRUE(proxy.ready());
    proxy.store().put("127.0.0.1", "token", portalgate::core::Duration{ 3600 });

    const std::string authority{ "127.0.0.1:" + std::to_string(unusedPort()) };
    const auto response{ exchange(proxy.endpoint(),
                                  "GET / HTTP/1.1\r\nHost: " + authority + "\r\nConnection: close\r\n\r\n") };

    EXPECT_EQ(response.rfind("HTTP/1.1 502 ", 0), 0U);
}

TEST(ProxyServer, LoggedOutAddressIsRedirectedAgain)
{
    ProxyHarness proxy{ "proxy_logout_" };
    ASSERT_TRUE(proxy.ready());
    proxy.store().put("127.0.0.1", "token", portalgate::core::Duration{ 3600 });
    proxy.store().remove("127.0.0.1");

    const auto response{ exchange(proxy.endpoint(), "GET / HTTP/1.1\r\nHost: example.org\r\n\r\n") };
    EXPECT_EQ(response.rfind("HTTP/1.1 511 ", 0), 0U);
}

TEST(ProxyServer, KeptAliveConnectionIsNotReusedForAnotherTarget)
{
    ProxyHarness proxy{ "proxy_keepalive_" };
    ASSERT_TRUE(proxy.ready());
    proxy.store().put("127.0.0.1", "token", portalgate::core::Duration{ 3600 });

    asio::io_context upstreamIoc;
    tcp::acceptor first{ upstreamIoc, tcp::endpoint{ asio::ip::make_address("127.0.0.1"), 0 } };
    tcp::acceptor second{ upstreamIoc, tcp::endpoint{ asio::ip::make_address("127.0.0.1"), 0 } };
    const std::string firstAuthority{ "127.0.0.1:" + std::to_string(first.local_endpoint().port()) };
    const std::string secondAuthority{ "127.0.0.1:" + std::to_string(second.local_endpoint().port()) };

    // Answers one request and keeps the connection, recording everything until the proxy hangs up.
    auto firstReceived{ std::async(std::launch::async,
                                   [&first]()
                                   {
                                       tcp::socket peer{ first.get_executor() };
                                       first.accept(peer);
                                       std::string received{};
                                       asio::read_until(peer, asio::dynamic_buffer(received), "\r\n\r\n");
                                       asio::write(peer, asio::buffer(std::string{
                                                             "HTTP/1.1 200 OK\r\nContent-Length: 1\r\n\r\na" }));
                                       boost::system::error_code ec{};
                                       asio::read(peer, asio::dynamic_buffer(received), ec);
                                       return received;
                                   }) };

    asio::io_context ioc;
    tcp::socket client{ ioc };
    client.connect(proxy.endpoint());

    const std::string firstRequest{ "GET http://" + firstAuthority + "/a HTTP/1.1\r\nHost: " + firstAuthority +
                                    "\r\n\r\n" };
    asio::write(client, asio::buffer(firstRequest));
    std::string response{};
    asio::read_until(client, asio::dynamic_buffer(response), "\r\n\r\na");
    EXPECT_EQ(response, "HTTP/1.1 200 OK\r\nContent-Length: 1\r\n\r\na");

    const std::string secondRequest{ "GET http://" + secondAuthority + "/b HTTP/1.1\r\nHost: " + secondAuthority +
                                     "\r\n\r\n" };
    asio::write(client, asio::buffer(secondRequest));
    const auto rest{ readUntilClosed(ioc, client, std::chrono::seconds{ 10 }) };
    ASSERT_TRUE(rest.has_value());
    EXPECT_TRUE(rest->empty());

    ASSERT_EQ(firstReceived.wait_for(std::chrono::seconds{ 10 }), std::future_status::ready);
    EXPECT_EQ(firstReceived.get(), firstRequest);

    // A client retries on a new connection, which reaches the second target.
    auto secondReceived{ std::async(std::launch::async,
                                    [&second]()
                                    {
                                        tcp::socket peer{ second.get_executor() };
                                        second.accept(peer);
                                        std::string head{};
                                        asio::read_until(peer, asio::dynamic_buffer(head), "\r\n\r\n");
                                        asio::write(peer, asio::buffer(std::string{
                                                              "HTTP/1.1 200 OK\r\nContent-Length: 1\r\n"
                                                              "Connection: close\r\n\r\nb" }));
                                        boost::system::error_code ec{};
                                        peer.shutdown(tcp::socket::shutdown_both, ec);
                                        peer.close(ec);
                                        return head;
                                    }) };

    const auto retried{ exchange(proxy.endpoint(), secondRequest) };
    EXPECT_EQ(retried.rfind("HTTP/1.1 200 OK", 0), 0U);
    ASSERT_EQ(secondReceived.wait_for(std::chrono::seconds{ 10 }), std::future_status::ready);
    EXPECT_EQ(secondReceived.get(), secondRequest);
}

TEST(ProxyServer, IncompleteHeadIsClosedAfterHeadTimeout)
{
    auto options{ harnessOptions() };
    options.headTimeout = std::chrono::seconds{ 1 };
    ProxyHarness proxy{ "proxy_head_timeout_", options };
    ASSERT_TRUE(proxy.ready());

    asio::io_context ioc;
    tcp::socket client{ ioc };
    client.connect(proxy.endpoint());
    asio::write(client, asio::buffer(std::string{ "GET http://example.com/ HTTP/1.1\r\nHost: exa" }));

    const auto started{ std::chrono::steady_clock::now() };
    const auto received{ readUntilClosed(ioc, client, std::chrono::seconds{ 5 }) };
    ASSERT_TRUE(received.has_value());
    EXPECT_TRUE(received->empty());
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds{ 900 });
}

TEST(ProxyServer, OversizedHeadIsClosedWithoutResponse)
{
    auto options{ harnessOptions() };
    options.headTimeout = std::chrono::seconds{ 30 };
    options.maxHeadBytes = 1024U;
    ProxyHarness proxy{ "proxy_head_size_", options };
    ASSERT_TRUE(proxy.ready());

    asio::io_context ioc;
    tcp::socket client{ ioc };
    client.connect(proxy.endpoint());
    asio::write(client, asio::buffer("GET / HTTP/1.1\r\nHost: example.com\r\nX-Pad: " + std::string(4096U, 'a')));

    // Closed well before the head timeout could fire.
    const auto received{ readUntilClosed(ioc, client, std::chrono::seconds{ 5 }) };
    ASSERT_TRUE(received.has_value());
    EXPECT_TRUE(received->empty());
}

TEST(ProxyServer, IdleTunnelIsClosed)
{
    auto options{ harnessOptions() };
    options.idleTimeout = std::chrono::seconds{ 1 };
    ProxyHarness proxy{ "proxy_idle_", options };
    ASSERT_TRUE(proxy.ready());
    proxy.store().put("127.0.0.1", "token", portalgate::core::Duration{ 3600 });

    asio::io_context upstreamIoc;
    tcp::acceptor upstream{ upstreamIoc, tcp::endpoint{ asio::ip::make_address("127.0.0.1"), 0 } };
    const std::string authority{ "127.0.0.1:" + std::to_string(upstream.local_endpoint().port()) };

    // Silent upstream: reads until the proxy gives up on the tunnel.
    auto upstreamSaw{ std::async(std::launch::async,
                                 [&upstream]()
                                 {
                                     tcp::socket peer{ upstream.get_executor() };
                                     upstream.accept(peer);
                                     std::string received{};
                                     boost::system::error_code ec{};
                                     asio::read(peer, asio::dynamic_buffer(received), ec);
                                     return received;
                                 }) };

    asio::io_context ioc;
    tcp::socket client{ ioc };
    client.connect(proxy.endpoint());
    asio::write(client, asio::buffer("CONNECT " + authority + " HTTP/1.1\r\nHost: " + authority + "\r\n\r\n"));

    std::string established{};
    asio::read_until(client, asio::dynamic_buffer(established), "\r\n\r\n");
    ASSERT_EQ(established, "HTTP/1.1 200 Connection Established\r\n\r\n");

    const auto received{ readUntilClosed(ioc, client, std::chrono::seconds{ 5 }) };
    ASSERT_TRUE(received.has_value());
    EXPECT_TRUE(received->empty());

    ASSERT_EQ(upstreamSaw.wait_for(std::chrono::seconds{ 10 }), std::future_status::ready);
    EXPECT_TRUE(upstreamSaw.get().empty());
}
