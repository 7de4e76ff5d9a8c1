#ifndef PORTALGATE_AUTH_AUTHHTTPSERVER_HPP
#define PORTALGATE_AUTH_AUTHHTTPSERVER_HPP

#include "AuthApi.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <spdlog/logger.h>
#include <string>

namespace portalgate::auth
{

// HTTP/1.1 listener for the authentication API. Each connection runs on its own strand and
// serves keep-alive requests until the peer closes or stays silent past `readTimeout`.
class AuthHttpServer final
{
public:
    AuthHttpServer(boost::asio::io_context& ioc, AuthApi& api, std::chrono::seconds readTimeout);

    AuthHttpServer(const AuthHttpServer&) = delete;
    AuthHttpServer& operator=(const AuthHttpServer&) = delete;
    AuthHttpServer(AuthHttpServer&&) = delete;
    AuthHttpServer& operator=(AuthHttpServer&&) = delete;
    ~AuthHttpServer() = default;

    // Throws boost::system::system_error when the address cannot be bound.
    void listen(const std::string& host, std::uint16_t port);

    [[nodiscard]] boost::asio::ip::tcp::endpoint localEndpoint() const;

    void start();
    void stop();

private:
    void accept();

    boost::asio::io_context* m_ioc{ nullptr };
    boost::asio::ip::tcp::acceptor m_acceptor;
    AuthApi* m_api{ nullptr };
    std::chrono::seconds m_readTimeout;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace portalgate::auth

#endif // PORTALGATE_AUTH_AUTHHTTPSERVER_HPP
