#include "AuthHttpServer.hpp"

#include "portalgate/core/Address.hpp"
#include "portalgate/log/Loggers.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <optional>
#include <utility>

namespace portalgate::auth
{
namespace
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

constexpr std::uint64_t g_kBodyLimit{ 64U * 1024U };

class HttpSession final : public std::enable_shared_from_this<HttpSession>
{
public:
    HttpSession(tcp::socket socket, AuthApi& api, std::chrono::seconds readTimeout)
        : m_stream(std::move(socket)), m_api(&api), m_readTimeout(readTimeout),
          m_log(portalgate::log::logger("auth"))
    {
        boost::system::error_code ec{};
        const auto peer{ m_stream.socket().remote_endpoint(ec) };
        if (!ec)
        {
            const auto text{ peer.address().to_string() };
            m_peer = portalgate::core::normalizeAddress(text).value_or(text);
        }
    }

    void run()
    {
        asio::dispatch(m_stream.get_executor(), [self{ shared_from_this() }]() { self->read(); });
    }

private:
    void read()
    {
        m_parser.emplace();
        m_parser->body_limit(g_kBodyLimit);
        m_stream.expires_after(m_readTimeout);
        http::async_read(m_stream, m_buffer, *m_parser,
                         [self{ shared_from_this() }](const beast::error_code& ec, std::size_t)
                         { self->onRead(ec); });
    }

    void onRead(const beast::error_code& ec)
    {
        if (ec == http::error::end_of_stream)
        {
            close();
            return;
        }
        if (ec)
        {
            if (ec != beast::error::timeout && ec != asio::error::operation_aborted)
            {
                m_log->debug("[{}] request read failed: {}", m_peer, ec.message());
            }
            close();
            return;
        }

        const auto request{ m_parser->release() };
        auto response{ std::make_shared<Response>(m_api->handle(request, m_peer)) };
        m_log->info("[{}] {} {} -> {}", m_peer, request.method_string().to_string(),
                    request.target().to_string(), response->result_int());

        m_stream.expires_after(m_readTimeout);
        http::async_write(m_stream, *response,
                          [self{ shared_from_this() }, response](const beast::error_code& writeEc, std::size_t)
                          {
                              if (writeEc)
                              {
                                  self->m_log->debug("[{}] response write failed: {}", self->m_peer,
                                                     writeEc.message());
                                  self->close();
                                  return;
                              }
                              if (!response->keep_alive())
                              {
                                  self->close();
                                  return;
                              }
                              self->read();
                          });
    }

    void close()
    {
        beast::error_code ec{};
        m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (ec && ec != asio::error::not_connected)
        {
            m_log->trace("[{}] shutdown: {}", m_peer, ec.message());
        }
    }

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    AuthApi* m_api{ nullptr };
    std::chrono::seconds m_readTimeout;
    std::string m_peer;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace

AuthHttpServer::AuthHttpServer(asio::io_context& ioc, AuthApi& api, std::chrono::seconds readTimeout)
    : m_ioc(&ioc), m_acceptor(asio::make_strand(ioc)), m_api(&api), m_readTimeout(readTimeout),
      m_log(portalgate::log::logger("auth"))
{
}

void AuthHttpServer::listen(const std::string& host, std::uint16_t port)
{
    const tcp::endpoint endpoint{ asio::ip::make_address(host), port };
    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(asio::socket_base::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen(asio::socket_base::max_listen_connections);
    m_log->info("auth API listening on {}:{}", endpoint.address().to_string(), localEndpoint().port());
}

tcp::endpoint AuthHttpServer::localEndpoint() const
{
    return m_acceptor.local_endpoint();
}

void AuthHttpServer::start()
{
    asio::post(m_acceptor.get_executor(), [this]() { accept(); });
}

void AuthHttpServer::stop()
{
    asio::post(m_acceptor.get_executor(),
               [this]()
               {
                   boost::system::error_code ec{};
                   m_acceptor.close(ec);
                   if (ec)
                   {
                       m_log->warn("closing the auth listener: {}", ec.message());
                   }
               });
}

void AuthHttpServer::accept()
{
    if (!m_acceptor.is_open())
    {
        return;
    }
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
                                    std::make_shared<HttpSession>(std::move(socket), *m_api, m_readTimeout)->run();
                                }
                                accept();
                            });
}

} // namespace portalgate::auth
