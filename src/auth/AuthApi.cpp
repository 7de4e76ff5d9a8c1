#include "AuthApi.hpp"

#include "FallbackPage.hpp"
#include "portalgate/log/Loggers.hpp"
#include "portalgate/net/HttpText.hpp"
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <algorithm>
#include <array>
#include <charconv>
#include <ctime>
#include <exception>
#include <optional>
#include <system_error>
#include <utility>
#include <variant>

namespace portalgate::auth
{
namespace
{

namespace http = boost::beast::http;
using nlohmann::json;
using portalgate::core::AuthError;

constexpr std::string_view g_kInternalError{ "internal server error" };
constexpr std::size_t g_kMaxDeviceListLimit{ 1000U };
constexpr std::size_t g_kMaxLogListLimit{ 500U };

[[nodiscard]] std::string_view toView(boost::beast::string_view s) noexcept
{
    return std::string_view{ s.data(), s.size() };
}

void addCors(Response& res)
{
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
}

[[nodiscard]] Response baseResponse(http::status status, const Request& request)
{
    Response res{ status, request.version() };
    res.set(http::field::server, "portalgate-auth");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(request.keep_alive());
    addCors(res);
    return res;
}

[[nodiscard]] Response jsonResponse(http::status status, const json& body, const Request& request)
{
    auto res{ baseResponse(status, request) };
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

[[nodiscard]] Response htmlResponse(http::status status, std::string html, const Request& request)
{
    auto res{ baseResponse(status, request) };
    res.set(http::field::content_type, "text/html; charset=utf-8");
    res.body() = std::move(html);
    res.prepare_payload();
    return res;
}

[[nodiscard]] Response errorResponse(http::status status, std::string_view message, const Request& request)
{
    return jsonResponse(status, json{ { "success", false }, { "error", std::string{ message } } }, request);
}

[[nodiscard]] Response methodNotAllowed(const Request& request, std::string_view allow)
{
    auto res{ errorResponse(http::status::method_not_allowed, "method not allowed", request) };
    res.set(http::field::allow, std::string{ allow });
    return res;
}

// Empty body reads as an empty object; anything else must be a JSON object.
[[nodiscard]] std::optional<json> parseJsonObject(const std::string& body)
{
    if (portalgate::net::trim(body).empty())
    {
        return json::object();
    }
    auto parsed{ json::parse(body, nullptr, false) };
    if (parsed.is_discarded() || !parsed.is_object())
    {
        return std::nullopt;
    }
    return parsed;
}

[[nodiscard]] std::string stringField(const json& object, const char* key)
{
    const auto it{ object.find(key) };
    if (it == object.end() || !it->is_string())
    {
        return {};
    }
    return it->get<std::string>();
}

[[nodiscard]] std::string queryValue(std::string_view query, std::string_view key)
{
    const auto params{ portalgate::net::parseQuery(query) };
    const auto it{ params.find(key) };
    return (it == params.end()) ? std::string{} : it->second;
}

// Decimal query parameter; nullopt when malformed.
[[nodiscard]] std::optional<std::size_t> parseCount(std::string_view text) noexcept
{
    std::size_t value{};
    const auto* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(text.data(), last, value) };
    if (text.empty() || ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::string isoTime(portalgate::core::TimePoint t)
{
    const std::time_t raw{ static_cast<std::time_t>(portalgate::core::toUnixSeconds(t)) };
    std::tm utc{};
    if (gmtime_r(&raw, &utc) == nullptr)
    {
        return {};
    }
    std::array<char, 32> buf{};
    const auto n{ std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &utc) };
    return std::string{ buf.data(), n };
}

[[nodiscard]] std::string userAgentOf(const Request& request)
{
    const auto it{ request.find(http::field::user_agent) };
    return (it == request.end()) ? std::string{} : std::string{ toView(it->value()) };
}

[[nodiscard]] json optionalSeconds(const std::optional<portalgate::core::TimePoint>& t)
{
    return t.has_value() ? json(portalgate::core::toUnixSeconds(*t)) : json(nullptr);
}

[[nodiscard]] http::status statusFor(AuthError error) noexcept
{
    switch (error)
    {
    case AuthError::InvalidCredentials:
        return http::status::unauthorized;
    case AuthError::InvalidAddress:
        return http::status::bad_request;
    case AuthError::LockedOut:
        return http::status::too_many_requests;
    case AuthError::StorageError:
    case AuthError::CryptoError:
        break;
    }
    return http::status::internal_server_error;
}

// Storage and crypto failures are reported without detail.
[[nodiscard]] Response authErrorResponse(AuthError error, const Request& request)
{
    const auto code{ statusFor(error) };
    return errorResponse(code,
                         (code == http::status::internal_server_error) ? g_kInternalError
                                                                        : portalgate::core::toString(error),
                         request);
}

} // namespace

std::string resolveClientAddress(const Request& request, std::string_view explicitAddress,
                                 std::string_view peerAddress)
{
    if (const auto given{ portalgate::net::trim(explicitAddress) }; !given.empty())
    {
        return std::string{ given };
    }

    if (const auto it{ request.find("X-Forwarded-For") }; it != request.end())
    {
        const auto value{ toView(it->value()) };
        const auto first{ portalgate::net::trim(value.substr(0, value.find(','))) };
        if (!first.empty())
        {
            return std::string{ first };
        }
    }

    if (const auto it{ request.find("X-Real-IP") }; it != request.end())
    {
        const auto value{ portalgate::net::trim(toView(it->value())) };
        if (!value.empty())
        {
            return std::string{ value };
        }
    }

    return std::string{ peerAddress };
}

AuthApi::AuthApi(portalgate::core::AuthService& service, ApiOptions options, portalgate::core::NowProvider now)
    : m_service(&service), m_options(std::move(options)), m_now(std::move(now)),
      m_log(portalgate::log::logger("auth"))
{
}

Response AuthApi::handle(const Request& request, std::string_view peerAddress)
{
    try
    {
        if (request.method() == http::verb::options)
        {
            auto res{ baseResponse(http::status::no_content, request) };
            res.prepare_payload();
            return res;
        }

        const auto split{ portalgate::net::splitTarget(toView(request.target())) };
        const auto path{ split.path };
        const auto method{ request.method() };
        const bool isGet{ method == http::verb::get };
        const bool isPost{ method == http::verb::post };

        if (path == "/api/health")
        {
            return isGet ? health(request) : methodNotAllowed(request, "GET, OPTIONS");
        }
        if (path == "/api/auth/login")
        {
            return isPost ? login(request, peerAddress) : methodNotAllowed(request, "POST, OPTIONS");
        }
        if (path == "/api/auth/logout")
        {
            return isPost ? logout(request, peerAddress) : methodNotAllowed(request, "POST, OPTIONS");
        }
        if (path == "/api/auth/verify")
        {
            return isPost ? verify(request, peerAddress) : methodNotAllowed(request, "POST, OPTIONS");
        }
        if (path == "/api/auth/status")
        {
            return isGet ? status(request, split.query, peerAddress) : methodNotAllowed(request, "GET, OPTIONS");
        }
        if (path == "/api/admin/devices")
        {
            return isGet ? devices(request, split.query) : methodNotAllowed(request, "GET, OPTIONS");
        }
        if (path == "/api/admin/logs")
        {
            return isGet ? loginLogs(request, split.query) : methodNotAllowed(request, "GET, OPTIONS");
        }
        if (path == "/api/auth/fallback")
        {
            if (isGet)
            {
                return fallbackForm(request, split.query, peerAddress);
            }
            return isPost ? fallbackSubmit(request, peerAddress) : methodNotAllowed(request, "GET, POST, OPTIONS");
        }

        return errorResponse(http::status::not_found, "endpoint not found", request);
    }
    catch (const std::exception& e)
    {
        m_log->error("{} {} failed: {}", toView(request.method_string()), toView(request.target()), e.what());
        return errorResponse(http::status::internal_server_error, g_kInternalError, request);
    }
}

Response AuthApi::login(const Request& request, std::string_view peerAddress)
{
    const auto body{ parseJsonObject(request.body()) };
    if (!body.has_value())
    {
        return errorResponse(http::status::bad_request, "request body must be a JSON object", request);
    }

    const std::string username{ portalgate::net::trim(stringField(*body, "username")) };
    const auto password{ stringField(*body, "password") };
    if (username.empty() || password.empty())
    {
        return errorResponse(http::status::bad_request, "username and password are required", request);
    }

    const auto address{ resolveClientAddress(request, stringField(*body, "client_ip"), peerAddress) };
    auto result{ m_service->login(address, username, password, userAgentOf(request)) };
    if (std::holds_alternative<AuthError>(result))
    {
        const auto error{ std::get<AuthError>(result) };
        if (error == AuthError::LockedOut)
        {
            const auto remaining{ m_service->lockoutRemaining(address).count() };
            return jsonResponse(http::status::too_many_requests,
                                json{ { "success", false },
                                      { "error", "too many failed attempts, retry in " +
                                                     std::to_string(remaining) + " seconds" },
                                      { "remaining_seconds", remaining } },
                                request);
        }
        return authErrorResponse(error, request);
    }

    const auto& issued{ std::get<portalgate::core::IssuedSession>(result) };
    return jsonResponse(http::status::ok,
                        json{ { "success", true },
                              { "message", "authenticated" },
                              { "data",
                                { { "session_token", issued.token },
                                  { "expires_in", issued.expiresIn.count() },
                                  { "username", username },
                                  { "client_ip", issued.address } } } },
                        request);
}

Response AuthApi::logout(const Request& request, std::string_view peerAddress)
{
    const auto body{ parseJsonObject(request.body()) };
    if (!body.has_value())
    {
        return errorResponse(http::status::bad_request, "request body must be a JSON object", request);
    }

    const auto address{ resolveClientAddress(request, stringField(*body, "client_ip"), peerAddress) };
    const auto result{ m_service->logout(address) };
    if (std::holds_alternative<AuthError>(result))
    {
        return authErrorResponse(std::get<AuthError>(result), request);
    }
    return jsonResponse(http::status::ok, json{ { "success", true }, { "message", "logged out" } }, request);
}

Response AuthApi::verify(const Request& request, std::string_view peerAddress)
{
    const auto body{ parseJsonObject(request.body()) };
    if (!body.has_value())
    {
        return errorResponse(http::status::bad_request, "request body must be a JSON object", request);
    }

    const auto token{ stringField(*body, "session_token") };
    if (token.empty())
    {
        return errorResponse(http::status::bad_request, "session_token is required", request);
    }

    const auto address{ resolveClientAddress(request, stringField(*body, "client_ip"), peerAddress) };
    const auto result{ m_service->verify(address, token) };
    if (std::holds_alternative<AuthError>(result))
    {
        return authErrorResponse(std::get<AuthError>(result), request);
    }
    if (!std::get<bool>(result))
    {
        return errorResponse(http::status::unauthorized, "session invalid or expired", request);
    }
    return jsonResponse(http::status::ok,
                        json{ { "success", true },
                              { "message", "session valid" },
                              { "data", { { "client_ip", address }, { "session_valid", true } } } },
                        request);
}

Response AuthApi::status(const Request& request, std::string_view query, std::string_view peerAddress)
{
    const auto address{ resolveClientAddress(request, queryValue(query, "client_ip"), peerAddress) };
    const auto result{ m_service->status(address) };
    if (std::holds_alternative<AuthError>(result))
    {
        return authErrorResponse(std::get<AuthError>(result), request);
    }
    return jsonResponse(http::status::ok,
                        json{ { "success", true }, { "data", sessionJson(std::get<portalgate::core::SessionView>(result)) } },
                        request);
}

Response AuthApi::health(const Request& request)
{
    return jsonResponse(http::status::ok,
                        json{ { "status", "healthy" },
                              { "timestamp", isoTime(m_now()) },
                              { "service", m_options.serviceName } },
                        request);
}

Response AuthApi::devices(const Request& request, std::string_view query)
{
    std::size_t limit{ m_options.deviceListLimit };
    if (const auto text{ queryValue(query, "limit") }; !text.empty())
    {
        const auto parsed{ parseCount(text) };
        if (!parsed.has_value() || *parsed == 0U)
        {
            return errorResponse(http::status::bad_request, "limit must be a positive integer", request);
        }
        limit = std::min(*parsed, g_kMaxDeviceListLimit);
    }

    const auto result{ m_service->devices(limit) };
    if (std::holds_alternative<AuthError>(result))
    {
        return errorResponse(http::status::internal_server_error, g_kInternalError, request);
    }

    const auto& views{ std::get<std::vector<portalgate::core::SessionView>>(result) };
    auto list{ json::array() };
    for (const auto& view : views)
    {
        list.push_back(sessionJson(view));
    }
    return jsonResponse(http::status::ok,
                        json{ { "success", true }, { "data", { { "devices", list }, { "total", views.size() } } } },
                        request);
}

Response AuthApi::loginLogs(const Request& request, std::string_view query)
{
    std::size_t limit{ m_options.logListLimit };
    if (const auto text{ queryValue(query, "limit") }; !text.empty())
    {
        const auto parsed{ parseCount(text) };
        if (!parsed.has_value() || *parsed == 0U)
        {
            return errorResponse(http::status::bad_request, "limit must be a positive integer", request);
        }
        limit = std::min(*parsed, g_kMaxLogListLimit);
    }

    std::size_t offset{ 0U };
    if (const auto text{ queryValue(query, "offset") }; !text.empty())
    {
        const auto parsed{ parseCount(text) };
        if (!parsed.has_value())
        {
            return errorResponse(http::status::bad_request, "offset must be a non-negative integer", request);
        }
        offset = *parsed;
    }

    const auto result{ m_service->loginHistory(limit, offset) };
    if (std::holds_alternative<AuthError>(result))
    {
        return errorResponse(http::status::internal_server_error, g_kInternalError, request);
    }

    auto logs{ json::array() };
    for (const auto& attempt : std::get<std::vector<portalgate::storage::LoginAttempt>>(result))
    {
        logs.push_back(json{ { "client_ip", attempt.address },
                             { "username", attempt.username },
                             { "success", attempt.success },
                             { "timestamp", isoTime(attempt.attemptedAt) },
                             { "user_agent", attempt.userAgent } });
    }
    return jsonResponse(http::status::ok,
                        json{ { "success", true },
                              { "data", { { "logs", logs }, { "limit", limit }, { "offset", offset } } } },
                        request);
}

Response AuthApi::fallbackForm(const Request& request, std::string_view query, std::string_view peerAddress)
{
    const auto address{ resolveClientAddress(request, queryValue(query, "client_ip"), peerAddress) };
    return htmlResponse(http::status::ok, renderLoginForm(address, "", ""), request);
}

Response AuthApi::fallbackSubmit(const Request& request, std::string_view peerAddress)
{
    const auto form{ portalgate::net::parseQuery(request.body()) };
    const auto field{ [&form](std::string_view key)
                      {
                          const auto it{ form.find(key) };
                          return (it == form.end()) ? std::string{} : it->second;
                      } };

    const std::string username{ portalgate::net::trim(field("username")) };
    const auto password{ field("password") };
    const auto address{ resolveClientAddress(request, field("client_ip"), peerAddress) };

    if (username.empty() || password.empty())
    {
        return htmlResponse(http::status::bad_request,
                            renderLoginForm(address, username, "Enter both username and password."), request);
    }

    const auto result{ m_service->login(address, username, password, userAgentOf(request)) };
    if (!std::holds_alternative<AuthError>(result))
    {
        const auto& issued{ std::get<portalgate::core::IssuedSession>(result) };
        return htmlResponse(http::status::ok, renderSuccessPage(issued.address, issued.expiresIn), request);
    }

    const auto error{ std::get<AuthError>(result) };
    std::string message{};
    switch (error)
    {
    case AuthError::InvalidCredentials:
        message = "Incorrect username or password.";
        break;
    case AuthError::LockedOut:
        message = "Too many failed attempts. Try again in " +
                  std::to_string(m_service->lockoutRemaining(address).count()) + " seconds.";
        break;
    case AuthError::InvalidAddress:
        message = "This device's network address could not be determined.";
        break;
    case AuthError::StorageError:
    case AuthError::CryptoError:
        message = "Sign-in is unavailable right now. Try again shortly.";
        break;
    }
    return htmlResponse(statusFor(error), renderLoginForm(address, username, message), request);
}

json AuthApi::sessionJson(const portalgate::core::SessionView& view) const
{
    return json{ { "client_ip", view.address },
                 { "state", std::string{ portalgate::core::toString(view.state) } },
                 { "authenticated", view.isAuthenticated() },
                 { "expires_in", view.remaining(m_now()).count() },
                 { "created_at", optionalSeconds(view.createdAt) },
                 { "expires_at", optionalSeconds(view.expiresAt) },
                 { "last_seen_at", optionalSeconds(view.lastSeenAt) },
                 { "user_agent", view.userAgent } };
}

} // namespace portalgate::auth
