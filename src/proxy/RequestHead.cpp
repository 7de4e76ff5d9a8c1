#include "RequestHead.hpp"

#include "portalgate/net/HttpText.hpp"
#include <algorithm>
#include <charconv>
#include <system_error>

namespace portalgate::proxy
{
namespace
{

constexpr std::string_view g_kTerminator{ "\r\n\r\n" };
constexpr std::uint16_t g_kHttpPort{ 80 };
constexpr std::uint16_t g_kHttpsPort{ 443 };

[[nodiscard]] bool isTokenChar(char c) noexcept
{
    constexpr std::string_view kExtra{ "!#$%&'*+-.^_`|~" };
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           kExtra.find(c) != std::string_view::npos;
}

[[nodiscard]] bool isToken(std::string_view s) noexcept
{
    return !s.empty() && std::all_of(s.begin(), s.end(), isTokenChar);
}

[[nodiscard]] std::optional<std::uint16_t> parsePort(std::string_view text) noexcept
{
    unsigned int value{};
    const auto* first{ text.data() };
    const auto* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(first, last, value) };
    if (text.empty() || ec != std::errc{} || ptr != last || value == 0U || value > 65535U)
    {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

// "http://host[:port]/path?q" -> authority and origin-form path.
[[nodiscard]] std::optional<std::pair<Authority, std::string>> parseAbsoluteTarget(std::string_view target)
{
    const auto sep{ target.find("://") };
    if (sep == std::string_view::npos)
    {
        return std::nullopt;
    }

    const auto scheme{ target.substr(0, sep) };
    std::uint16_t defaultPort{ g_kHttpPort };
    if (portalgate::net::iequals(scheme, "https"))
    {
        defaultPort = g_kHttpsPort;
    }
    else if (!portalgate::net::iequals(scheme, "http"))
    {
        return std::nullopt;
    }

    const auto rest{ target.substr(sep + 3U) };
    const auto slash{ rest.find_first_of("/?") };
    auto authorityText{ rest.substr(0, slash) };
    if (const auto at{ authorityText.rfind('@') }; at != std::string_view::npos)
    {
        authorityText = authorityText.substr(at + 1U);
    }

    auto authority{ parseAuthority(authorityText, defaultPort) };
    if (!authority.has_value())
    {
        return std::nullopt;
    }

    std::string path{ (slash == std::string_view::npos) ? std::string_view{ "/" } : rest.substr(slash) };
    if (path.front() == '?')
    {
        path.insert(path.begin(), '/');
    }
    return std::make_pair(std::move(*authority), std::move(path));
}

} // namespace

std::string_view toString(HeadStatus status) noexcept
{
    switch (status)
    {
    case HeadStatus::Complete:
        return "complete";
    case HeadStatus::Incomplete:
        return "incomplete";
    case HeadStatus::Malformed:
        return "malformed";
    case HeadStatus::TooLarge:
        break;
    }
    return "too large";
}

std::optional<std::string_view> RequestHead::header(std::string_view name) const noexcept
{
    for (const auto& [key, value] : headers)
    {
        if (portalgate::net::iequals(key, name))
        {
            return std::string_view{ value };
        }
    }
    return std::nullopt;
}

std::optional<Authority> parseAuthority(std::string_view text, std::uint16_t defaultPort)
{
    text = portalgate::net::trim(text);
    if (text.empty())
    {
        return std::nullopt;
    }

    Authority out{};
    std::string_view portText{};
    if (text.front() == '[')
    {
        const auto close{ text.find(']') };
        if (close == std::string_view::npos || close == 1U)
        {
            return std::nullopt;
        }
        out.host = std::string{ text.substr(1U, close - 1U) };
        const auto tail{ text.substr(close + 1U) };
        if (!tail.empty())
        {
            if (tail.front() != ':')
            {
                return std::nullopt;
            }
            portText = tail.substr(1U);
        }
    }
    else
    {
        const auto colon{ text.rfind(':') };
        // A bare IPv6 literal has several colons and no port.
        if (colon != std::string_view::npos && text.find(':') == colon)
        {
            out.host = std::string{ text.substr(0, colon) };
            portText = text.substr(colon + 1U);
        }
        else
        {
            out.host = std::string{ text };
        }
    }

    if (out.host.empty() || out.host.find_first_of(" \t/\\") != std::string::npos)
    {
        return std::nullopt;
    }

    if (portText.empty())
    {
        out.port = defaultPort;
    }
    else
    {
        const auto port{ parsePort(portText) };
        if (!port.has_value())
        {
            return std::nullopt;
        }
        out.port = *port;
    }
    return out;
}

HeadParse parseRequestHead(std::string_view buffer, std::size_t maxBytes)
{
    HeadParse result{};

    const auto end{ buffer.find(g_kTerminator) };
    if (end == std::string_view::npos)
    {
        result.status = (buffer.size() >= maxBytes) ? HeadStatus::TooLarge : HeadStatus::Incomplete;
        return result;
    }
    result.length = end + g_kTerminator.size();
    if (result.length > maxBytes)
    {
        result.status = HeadStatus::TooLarge;
        return result;
    }

    result.status = HeadStatus::Malformed;
    const auto text{ buffer.substr(0, end + 2U) };

    const auto lineEnd{ text.find("\r\n") };
    const auto requestLine{ text.substr(0, lineEnd) };
    const auto sp1{ requestLine.find(' ') };
    const auto sp2{ requestLine.rfind(' ') };
    if (sp1 == std::string_view::npos || sp2 == sp1)
    {
        return result;
    }

    auto& head{ result.head };
    const auto method{ requestLine.substr(0, sp1) };
    const auto target{ requestLine.substr(sp1 + 1U, sp2 - sp1 - 1U) };
    const auto version{ requestLine.substr(sp2 + 1U) };
    if (!isToken(method) || target.empty() || target.find(' ') != std::string_view::npos ||
        version.substr(0, 5) != "HTTP/")
    {
        return result;
    }
    head.method = std::string{ method };
    head.target = std::string{ target };
    head.version = std::string{ version };

    std::size_t pos{ lineEnd + 2U };
    while (pos < text.size())
    {
        const auto next{ text.find("\r\n", pos) };
        const auto line{ text.substr(pos, next - pos) };
        pos = next + 2U;

        const auto colon{ line.find(':') };
        if (colon == std::string_view::npos || !isToken(line.substr(0, colon)))
        {
            return result;
        }
        head.headers.emplace_back(std::string{ line.substr(0, colon) },
                                  std::string{ portalgate::net::trim(line.substr(colon + 1U)) });
    }

    if (portalgate::net::iequals(head.method, "CONNECT"))
    {
        const auto authority{ parseAuthority(head.target, g_kHttpsPort) };
        if (!authority.has_value())
        {
            return result;
        }
        head.host = authority->host;
        head.port = authority->port;
        head.path = "/";
    }
    else if (head.target.front() == '/')
    {
        const auto hostHeader{ head.header("Host") };
        if (!hostHeader.has_value())
        {
            return result;
        }
        const auto authority{ parseAuthority(*hostHeader, g_kHttpPort) };
        if (!authority.has_value())
        {
            return result;
        }
        head.host = authority->host;
        head.port = authority->port;
        head.path = head.target;
    }
    else
    {
        auto absolute{ parseAbsoluteTarget(head.target) };
        if (!absolute.has_value())
        {
            return result;
        }
        head.host = std::move(absolute->first.host);
        head.port = absolute->first.port;
        head.path = std::move(absolute->second);
    }

    result.status = HeadStatus::Complete;
    return result;
}

} // namespace portalgate::proxy
