#include "ProxyConnection.hpp"

#include "PortalRedirect.hpp"
#include "portalgate/core/Address.hpp"
#include "portalgate/core/PendingRequest.hpp"
#include "portalgate/log/Loggers.hpp"
#include "portalgate/storage/StorageErrors.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <exception>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace portalgate::proxy
{
namespace
{

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

constexpr std::string_view g_kTunnelEstablished{ "HTTP/1.1 200 Connection Established\r\n\r\n" };

[[nodiscard]] std::string sourceAddressOf(const tcp::endpoint& peer)
{
    const auto text{ peer.address().to_string() };
    return portalgate::core::normalizeAddress(text).value_or(text);
}

void closeSocket(tcp::socket& socket, spdlog::logger& log)
{
    if (!socket.is_open())
    {
        return;
    }
    boost::system::error_code ec{};
    socket.shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != asio::error::not_connected)
    {
        log.trace("socket shutdown: {}", ec.message());
    }
    socket.close(ec);
    if (ec)
    {
        log.debug("socket close: {}", ec.message());
    }
}

} // namespace

ProxyConnection::ProxyConnection(tcp::socket client, const ProxyContext& context)
    : m_client(std::move(client)), m_upstream(m_client.get_executor()), m_resolver(m_client.get_executor()),
      m_deadline(m_client.get_executor()), m_context(&context), m_log(portalgate::log::logger("proxy"))
{
}

void ProxyConnection::start()
{
    boost::system::error_code ec{};
    const auto peer{ m_client.remote_endpoint(ec) };
    if (ec)
    {
        m_log->debug("dropping connection without a peer address: {}", ec.message());
        closeAll();
        return;
    }
    m_source = sourceAddressOf(peer);

    m_deadline.expires_after(m_context->options.headTimeout);
    m_deadline.async_wait([self{ shared_from_this() }](const boost::system::error_code& waitEc)
                          { self->onHeadTimeout(waitEc); });
    readHead();
}

void ProxyConnection::onHeadTimeout(const boost::system::error_code& ec)
{
    if (ec == asio::error::operation_aborted || m_phase != Phase::Head)
    {
        return;
    }
    m_log->info("[{}] no request head within {}s, closing", m_source, m_context->options.headTimeout.count());
    closeAll();
}

void ProxyConnection::readHead()
{
    m_client.async_read_some(
        asio::buffer(m_readChunk),
        [self{ shared_from_this() }](const boost::system::error_code& ec, std::size_t n)
        {
            if (self->m_phase != Phase::Head)
            {
                return;
            }
            if (ec)
            {
                self->m_log->debug("[{}] client left before a complete request head: {}", self->m_source,
                                   ec.message());
                self->closeAll();
                return;
            }

            self->m_headBuffer.append(self->m_readChunk.data(), n);
            auto parsed{ parseRequestHead(self->m_headBuffer, self->m_context->options.maxHeadBytes) };
            switch (parsed.status)
            {
            case HeadStatus::Incomplete:
                self->readHead();
                return;
            case HeadStatus::Complete:
                self->onHeadParsed(std::move(parsed));
                return;
            case HeadStatus::Malformed:
            case HeadStatus::TooLarge:
                break;
            }
            self->m_log->info("[{}] {} request head, closing", self->m_source, toString(parsed.status));
            self->closeAll();
        });
}

void ProxyConnection::onHeadParsed(HeadParse parsed)
{
    m_phase = Phase::Deciding;
    m_deadline.cancel();

    m_head = std::move(parsed.head);
    m_headLength = parsed.length;
    m_scheme = portalgate::core::classifyScheme(m_head.method);

    portalgate::core::PendingRequest request{};
    request.method = m_head.method;
    request.target = m_head.target;
    request.host = m_head.host;
    request.port = m_head.port;
    request.scheme = m_scheme;
    request.sourceAddress = m_source;
    request.userAgent = std::string{ m_head.header("User-Agent").value_or("") };
    request.accept = std::string{ m_head.header("Accept").value_or("") };

    // The lookup may block on SQLite; the verdict comes back to this connection's strand.
    auto executor{ m_client.get_executor() };
    asio::post(*m_context->storePool,
               [self{ shared_from_this() }, executor, request{ std::move(request) }]()
               {
                   const auto action{ self->m_context->policy->decide(request) };
                   asio::post(executor, [self, action]() { self->execute(action); });
               });
}

void ProxyConnection::execute(portalgate::core::Action action)
{
    if (m_phase != Phase::Deciding)
    {
        return;
    }

    m_log->info("[{}] {} {} ({}:{}) -> {}", m_source, m_head.method, m_head.target, m_head.host, m_head.port,
                portalgate::core::toString(action));
    recordActivity();

    switch (action)
    {
    case portalgate::core::Action::Forward:
        connectUpstream();
        return;
    case portalgate::core::Action::RedirectAuth:
        sendRedirect();
        return;
    case portalgate::core::Action::Reject:
        break;
    }
    closeAll();
}

void ProxyConnection::recordActivity()
{
    asio::post(*m_context->storePool,
               [store{ m_context->store }, source{ m_source }, log{ m_log }]()
               {
                   try
                   {
                       store->touch(source);
                   }
                   catch (const portalgate::storage::StoreIoError& e)
                   {
                       log->warn("[{}] last-seen update failed: {}", source, e.what());
                   }
                   catch (const std::invalid_argument& e)
                   {
                       log->warn("[{}] last-seen update skipped: {}", source, e.what());
                   }
                   catch (const std::exception& e)
                   {
                       log->error("[{}] last-seen update raised: {}", source, e.what());
                   }
               });
}

void ProxyConnection::sendRedirect()
{
    const auto status{ redirectStatusFor(m_head.host, m_head.path) };
    const auto loginUrl{ portalUrlFor(m_context->options.portalUrl, m_source) };
    m_log->debug("[{}] redirecting with {} to {}", m_source, status, loginUrl);
    writeThenClose(std::make_shared<std::string>(buildRedirectResponse(status, loginUrl)));
}

void ProxyConnection::connectUpstream()
{
    m_phase = Phase::Connecting;

    m_deadline.expires_after(m_context->options.connectTimeout);
    m_deadline.async_wait(
        [self{ shared_from_this() }](const boost::system::error_code& ec)
        {
            if (ec == asio::error::operation_aborted || self->m_phase != Phase::Connecting)
            {
                return;
            }
            self->m_log->warn("[{}] connect to {}:{} timed out", self->m_source, self->m_head.host,
                              self->m_head.port);
            // Aborts the pending resolve or connect, which then answers 502.
            self->m_resolver.cancel();
            boost::system::error_code closeEc{};
            self->m_upstream.close(closeEc);
            if (closeEc)
            {
                self->m_log->debug("[{}] upstream close: {}", self->m_source, closeEc.message());
            }
        });

    m_resolver.async_resolve(m_head.host, std::to_string(m_head.port),
                             [self{ shared_from_this() }](const boost::system::error_code& ec,
                                                          const tcp::resolver::results_type& results)
                             {
                                 if (self->m_phase != Phase::Connecting)
                                 {
                                     return;
                                 }
                                 if (ec)
                                 {
                                     self->onUpstreamConnected(ec);
                                     return;
                                 }
                                 asio::async_connect(self->m_upstream, results,
                                                     [self](const boost::system::error_code& connectEc,
                                                            const tcp::endpoint&)
                                                     { self->onUpstreamConnected(connectEc); });
                             });
}

void ProxyConnection::onUpstreamConnected(const boost::system::error_code& ec)
{
    if (m_phase != Phase::Connecting)
    {
        return;
    }
    m_deadline.cancel();

    if (ec)
    {
        m_log->warn("[{}] upstream {}:{} unreachable: {}", m_source, m_head.host, m_head.port, ec.message());
        sendBadGateway();
        return;
    }

    if (m_scheme == portalgate::core::Scheme::Tunnel)
    {
        // Only bytes after the CONNECT head belong to the tunnel.
        m_headBuffer.erase(0, m_headLength);
        asio::async_write(m_client, asio::buffer(g_kTunnelEstablished),
                          [self{ shared_from_this() }](const boost::system::error_code& writeEc, std::size_t)
                          {
                              if (writeEc)
                              {
                                  self->m_log->debug("[{}] tunnel confirmation failed: {}", self->m_source,
                                                     writeEc.message());
                                  self->closeAll();
                                  return;
                              }
                              self->flushPendingToUpstream();
                          });
        return;
    }

    // The head goes out as read; what follows it is released request by request.
    m_framer.emplace(m_head, m_context->options.maxHeadBytes);
    auto step{ m_framer->feed(std::string_view{ m_headBuffer }.substr(m_headLength)) };
    m_headBuffer.resize(m_headLength);
    m_headBuffer += step.forward;
    if (step.stop != FrameStop::None)
    {
        m_log->info("[{}] {} on a connection to {}:{}, ending it", m_source, toString(step.stop), m_head.host,
                    m_head.port);
    }
    flushPendingToUpstream();
}

void ProxyConnection::flushPendingToUpstream()
{
    if (m_headBuffer.empty())
    {
        startRelay();
        return;
    }
    asio::async_write(m_upstream, asio::buffer(m_headBuffer),
                      [self{ shared_from_this() }](const boost::system::error_code& ec, std::size_t)
                      {
                          if (ec)
                          {
                              self->m_log->debug("[{}] upstream write failed: {}", self->m_source, ec.message());
                              self->closeAll();
                              return;
                          }
                          self->m_headBuffer.clear();
                          self->startRelay();
                      });
}

void ProxyConnection::sendBadGateway()
{
    closeSocket(m_upstream, *m_log);
    writeThenClose(std::make_shared<std::string>(buildBadGatewayResponse()));
}

void ProxyConnection::startRelay()
{
    m_phase = Phase::Relaying;
    m_toUpstream.from = &m_client;
    m_toUpstream.to = &m_upstream;
    m_toClient.from = &m_upstream;
    m_toClient.to = &m_client;

    m_lastActivity = std::chrono::steady_clock::now();
    armIdleTimer();
    if (m_framer.has_value() && m_framer->stopped())
    {
        finishPipe(m_toUpstream);
    }
    else
    {
        pump(m_toUpstream);
    }
    pump(m_toClient);
}

void ProxyConnection::pump(Pipe& pipe)
{
    pipe.from->async_read_some(
        asio::buffer(pipe.buffer),
        [self{ shared_from_this() }, &pipe](const boost::system::error_code& ec, std::size_t n)
        {
            if (self->m_phase != Phase::Relaying)
            {
                return;
            }
            if (ec == asio::error::eof)
            {
                self->finishPipe(pipe);
                return;
            }
            if (ec)
            {
                self->m_log->debug("[{}] relay read ended: {}", self->m_source, ec.message());
                self->closeAll();
                return;
            }

            self->m_lastActivity = std::chrono::steady_clock::now();
            if (&pipe == &self->m_toUpstream && self->m_framer.has_value())
            {
                self->relayFramed(n);
                return;
            }
            asio::async_write(*pipe.to, asio::buffer(pipe.buffer.data(), n),
                              [self, &pipe](const boost::system::error_code& writeEc, std::size_t)
                              {
                                  if (self->m_phase != Phase::Relaying)
                                  {
                                      return;
                                  }
                                  if (writeEc)
                                  {
                                      self->m_log->debug("[{}] relay write ended: {}", self->m_source,
                                                         writeEc.message());
                                      self->closeAll();
                                      return;
                                  }
                                  self->m_lastActivity = std::chrono::steady_clock::now();
                                  self->pump(pipe);
                              });
        });
}

void ProxyConnection::relayFramed(std::size_t n)
{
    auto step{ m_framer->feed(std::string_view{ m_toUpstream.buffer.data(), n }) };
    const auto stop{ step.stop };
    if (stop != FrameStop::None)
    {
        m_log->info("[{}] {} on a connection to {}:{}, ending it", m_source, toString(stop), m_head.host,
                    m_head.port);
    }
    if (step.forward.empty())
    {
        afterFramedWrite(stop);
        return;
    }

    m_framed = std::move(step.forward);
    asio::async_write(m_upstream, asio::buffer(m_framed),
                      [self{ shared_from_this() }, stop](const boost::system::error_code& ec, std::size_t)
                      {
                          if (self->m_phase != Phase::Relaying)
                          {
                              return;
                          }
                          if (ec)
                          {
                              self->m_log->debug("[{}] relay write ended: {}", self->m_source, ec.message());
                              self->closeAll();
                              return;
                          }
                          self->m_lastActivity = std::chrono::steady_clock::now();
                          self->afterFramedWrite(stop);
                      });
}

void ProxyConnection::afterFramedWrite(FrameStop stop)
{
    if (stop == FrameStop::None)
    {
        pump(m_toUpstream);
        return;
    }
    // The upstream sees the end of its requests; its pending response still reaches the client.
    finishPipe(m_toUpstream);
}

void ProxyConnection::finishPipe(Pipe& pipe)
{
    pipe.done = true;

    // Propagate the half-close so the peer still sees the end of the request or response.
    boost::system::error_code ec{};
    pipe.to->shutdown(tcp::socket::shutdown_send, ec);
    if (ec)
    {
        m_log->trace("[{}] half-close: {}", m_source, ec.message());
    }

    if (m_toUpstream.done && m_toClient.done)
    {
        m_log->debug("[{}] relay to {}:{} finished", m_source, m_head.host, m_head.port);
        closeAll();
    }
}

void ProxyConnection::armIdleTimer()
{
    m_deadline.expires_at(m_lastActivity + m_context->options.idleTimeout);
    m_deadline.async_wait(
        [self{ shared_from_this() }](const boost::system::error_code& ec)
        {
            if (ec == asio::error::operation_aborted || self->m_phase != Phase::Relaying)
            {
                return;
            }
            if (std::chrono::steady_clock::now() - self->m_lastActivity >= self->m_context->options.idleTimeout)
            {
                self->m_log->debug("[{}] relay to {}:{} idle for {}s, closing", self->m_source, self->m_head.host,
                                   self->m_head.port, self->m_context->options.idleTimeout.count());
                self->closeAll();
                return;
            }
            self->armIdleTimer();
        });
}

void ProxyConnection::writeThenClose(std::shared_ptr<std::string> bytes)
{
    m_phase = Phase::Responding;
    asio::async_write(m_client, asio::buffer(*bytes),
                      [self{ shared_from_this() }, bytes](const boost::system::error_code& ec, std::size_t)
                      {
                          if (ec)
                          {
                              self->m_log->debug("[{}] response write failed: {}", self->m_source, ec.message());
                          }
                          self->closeAll();
                      });
}

void ProxyConnection::closeAll()
{
    if (m_phase == Phase::Closed)
    {
        return;
    }
    m_phase = Phase::Closed;

    m_deadline.cancel();
    m_resolver.cancel();
    closeSocket(m_client, *m_log);
    closeSocket(m_upstream, *m_log);
}

} // namespace portalgate::proxy
