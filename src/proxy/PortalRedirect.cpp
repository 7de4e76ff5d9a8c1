#include "PortalRedirect.hpp"

#include "portalgate/net/HttpText.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <new>
#include <string>

namespace portalgate::proxy
{
namespace
{

constexpr std::array<std::string_view, 3> g_kProbeHosts{ "captive.apple.com", "connectivitycheck",
                                                          "clients3.google.com" };
constexpr std::array<std::string_view, 2> g_kProbePaths{ "hotspot-detect", "generate_204" };
constexpr std::array<std::string_view, 11> g_kForcedRoots{ "apple.com",    "icloud.com",  "baidu.com",
                                                           "qq.com",       "wechat.com",  "google.com",
                                                           "gstatic.com",  "youtube.com", "bilibili.com",
                                                           "taobao.com",   "tmall.com" };

[[nodiscard]] std::string lowerCopy(std::string_view s)
{
    std::string out{ s };
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[nodiscard]] bool isSameOrSubdomain(std::string_view host, std::string_view root) noexcept
{
    if (host == root)
    {
        return true;
    }
    return host.size() > root.size() && host.substr(host.size() - root.size()) == root &&
           host[host.size() - root.size() - 1U] == '.';
}

[[nodiscard]] std::string_view reasonPhrase(unsigned status) noexcept
{
    switch (status)
    {
    case g_kStatusFound:
        return "Found";
    case g_kStatusNetworkAuthRequired:
        return "Network Authentication Required";
    default:
        break;
    }
    return "Redirect";
}

} // namespace

bool isConnectivityProbe(std::string_view host, std::string_view path) noexcept
{
    try
    {
        const auto h{ lowerCopy(host) };
        const auto p{ lowerCopy(path) };
        const bool hostHit{ std::any_of(g_kProbeHosts.begin(), g_kProbeHosts.end(), [&](std::string_view needle)
                                        { return h.find(needle) != std::string::npos; }) };
        const bool pathHit{ std::any_of(g_kProbePaths.begin(), g_kProbePaths.end(), [&](std::string_view needle)
                                        { return p.find(needle) != std::string::npos; }) };
        return hostHit || pathHit;
    }
    catch (const std::bad_alloc&)
    {
        return false;
    }
}

bool isForcedRootDomain(std::string_view host) noexcept
{
    try
    {
        auto h{ lowerCopy(host) };
        while (!h.empty() && h.back() == '.')
        {
            h.pop_back();
        }
        return std::any_of(g_kForcedRoots.begin(), g_kForcedRoots.end(),
                           [&](std::string_view root) { return isSameOrSubdomain(h, root); });
    }
    catch (const std::bad_alloc&)
    {
        return false;
    }
}

unsigned redirectStatusFor(std::string_view host, std::string_view path) noexcept
{
    if (isConnectivityProbe(host, path) || isForcedRootDomain(host))
    {
        return g_kStatusFound;
    }
    return g_kStatusNetworkAuthRequired;
}

std::string portalUrlFor(std::string_view portalUrl, std::string_view clientAddress)
{
    return portalgate::net::appendQueryParam(portalUrl, "client_ip", clientAddress);
}

std::string buildRedirectResponse(unsigned status, std::string_view loginUrl)
{
    const auto escaped{ portalgate::net::htmlEscape(loginUrl) };

    std::string body{};
    body.append("<html><head><title>Network Authentication Required</title></head><body>");
    body.append("<p>This network requires authentication before Internet access.</p>");
    body.append("<p><a href=\"").append(escaped).append("\">Sign in to the network</a></p>");
    body.append("</body></html>");

    std::string out{};
    out.append("HTTP/1.1 ").append(std::to_string(status)).append(" ").append(reasonPhrase(status)).append("\r\n");
    out.append("Location: ").append(loginUrl).append("\r\n");
    out.append("X-Login-URL: ").append(loginUrl).append("\r\n");
    out.append("Cache-Control: no-cache\r\n");
    out.append("Content-Type: text/html; charset=utf-8\r\n");
    out.append("Content-Length: ").append(std::to_string(body.size())).append("\r\n");
    out.append("Connection: close\r\n\r\n");
    out.append(body);
    return out;
}

std::string buildBadGatewayResponse()
{
    constexpr std::string_view kBody{ "<html><body><p>Bad Gateway</p></body></html>" };

    std::string out{ "HTTP/1.1 502 Bad Gateway\r\n" };
    out.append("Content-Type: text/html; charset=utf-8\r\n");
    out.append("Content-Length: ").append(std::to_string(kBody.size())).append("\r\n");
    out.append("Connection: close\r\n\r\n");
    out.append(kBody);
    return out;
}

} // namespace portalgate::proxy
