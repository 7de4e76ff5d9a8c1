#ifndef PORTALGATE_AUTH_AUTHAPI_HPP
#define PORTALGATE_AUTH_AUTHAPI_HPP

#include "portalgate/core/AuthService.hpp"
#include "portalgate/core/Session.hpp"
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>
#include <string>
#include <string_view>

namespace portalgate::auth
{

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

struct ApiOptions final
{
    std::string serviceName{ "portalgate-auth" };
    std::size_t deviceListLimit{ 100U };
    std::size_t logListLimit{ 50U };
};

// Routes one HTTP request of the authentication API to the AuthService. No I/O of its own,
// so a request can be answered without a socket.
class AuthApi final
{
public:
    AuthApi(portalgate::core::AuthService& service, ApiOptions options = {},
            portalgate::core::NowProvider now = portalgate::core::systemNow);

    // `peerAddress` is the TCP peer, used when neither the body nor forwarding headers name the device.
    [[nodiscard]] Response handle(const Request& request, std::string_view peerAddress);

private:
    [[nodiscard]] Response login(const Request& request, std::string_view peerAddress);
    [[nodiscard]] Response logout(const Request& request, std::string_view peerAddress);
    [[nodiscard]] Response verify(const Request& request, std::string_view peerAddress);
    [[nodiscard]] Response status(const Request& request, std::string_view query, std::string_view peerAddress);
    [[nodiscard]] Response health(const Request& request);
    [[nodiscard]] Response devices(const Request& request, std::string_view query);
    [[nodiscard]] Response loginLogs(const Request& request, std::string_view query);
    [[nodiscard]] Response fallbackForm(const Request& request, std::string_view query, std::string_view peerAddress);
    [[nodiscard]] Response fallbackSubmit(const Request& request, std::string_view peerAddress);

    [[nodiscard]] nlohmann::json sessionJson(const portalgate::core::SessionView& view) const;

    portalgate::core::AuthService* m_service{ nullptr };
    ApiOptions m_options;
    portalgate::core::NowProvider m_now;
    std::shared_ptr<spdlog::logger> m_log;
};

// Device address for a request: explicit value, then X-Forwarded-For (first entry),
// then X-Real-IP, then the TCP peer.
[[nodiscard]] std::string resolveClientAddress(const Request& request, std::string_view explicitAddress,
                                               std::string_view peerAddress);

} // namespace portalgate::auth

#endif // PORTALGATE_AUTH_AUTHAPI_HPP
