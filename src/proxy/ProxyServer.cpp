#include "ProxyServer.hpp"

#include "portalgate/log/Loggers.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <utility>

namespace portalgate::proxy
{
namespace
{

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

} // namespace

ProxyServer::ProxyServer(asio::io_context& ioc, const portalgate::core::PolicyEngine& policy,
                         portalgate::storage::ISessionStore& store, ProxyOptions options, std::size_t storeThreads)
    : m_ioc(&ioc), m_acceptor(asio::make_strand(ioc)), m_storePool(storeThreads == 0U ? 1U : storeThreads),
      m_log(portalgate::log::logger("proxy"))
{
    m_context.policy = &policy;
    m_context.store = &store;
    m_context.storePool = &m_storePool;
    m_context.options = std::move(options);
}

ProxyServer::~ProxyServer()
{
    boost::system::error_code ec{};
    m_acceptor.close(ec);
    if (ec)
    {
        m_log->debug("closing the proxy listener: {}", ec.message());
    }
    m_storePool.join();
}

void ProxyServer::listen(const std::string& host, std::uint16_t port)
{
    const tcp::endpoint endpoint{ asio::ip::make_address(host), port };
    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(asio::socket_base::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen(asio::socket_base::max_listen_connections);
    m_log->info("proxy listening on {}:{}", endpoint.address().to_string(), localEndpoint().port());
}

tcp::endpoint ProxyServer::localEndpoint() const
{
    return m_acceptor.local_endpoint();
}

void ProxyServer::start()
{
    asio::post(m_acceptor.get_executor(), [this]() { accept(); });
}

void ProxyServer::stop()
{
    asio::post(m_acceptor.get_executor(),
               [this]()
               {
                   boost::system::error_code ec{};
                   m_acceptor.close(ec);
                   if (ec)
                   {
                       m_log->warn("closing the proxy listener: {}", ec.message());
                   }
               });
}

void ProxyServer::accept()
{
    if (!m_acceptor.is_open())
    {
        return;
    }
    // Each connection gets its own strand; its handlers never run concurrently.
    m_acceptor.async_accept(asio::make_strand(*m_ioc),
                            [this](const boost::system::error_code& ec, tcp::socket socket)
                            {
                                if (ec == asio::error::operation_aborted)
                                {
                                    return;
                                }
                                if (ec)
                                {
                                    m_log->warn("accept failed: {}", ec.message());
                                }
                                else
                                {
                                    std::make_shared<ProxyConnection>(std::move(socket), m_context)->start();
                                }
                                accept();
                            });
}

} // namespace portalgate::proxy
