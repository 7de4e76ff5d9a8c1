#ifndef PORTALGATE_PROXY_PROXYSERVER_HPP
#define PORTALGATE_PROXY_PROXYSERVER_HPP

#include "ProxyConnection.hpp"
#include "portalgate/core/PolicyEngine.hpp"
#include "portalgate/storage/ISessionStore.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <spdlog/logger.h>
#include <string>

namespace portalgate::proxy
{

// Explicit HTTP proxy listener. Connections run on the io_context passed in; blocking store
// calls run on an internal pool of `storeThreads` threads.
class ProxyServer final
{
public:
    ProxyServer(boost::asio::io_context& ioc, const portalgate::core::PolicyEngine& policy,
                portalgate::storage::ISessionStore& store, ProxyOptions options, std::size_t storeThreads);

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;
    ProxyServer(ProxyServer&&) = delete;
    ProxyServer& operator=(ProxyServer&&) = delete;
    ~ProxyServer();

    // Throws boost::system::system_error when the address cannot be bound.
    void listen(const std::string& host, std::uint16_t port);

    [[nodiscard]] boost::asio::ip::tcp::endpoint localEndpoint() const;

    void start();

    // Stops accepting; connections already accepted run to completion.
    void stop();

private:
    void accept();

    boost::asio::io_context* m_ioc{ nullptr };
    boost::asio::ip::tcp::acceptor m_acceptor;
    boost::asio::thread_pool m_storePool;
    ProxyContext m_context;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace portalgate::proxy

#endif // PORTALGATE_PROXY_PROXYSERVER_HPP
