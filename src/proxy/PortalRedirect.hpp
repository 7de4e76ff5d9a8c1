#ifndef PORTALGATE_PROXY_PORTALREDIRECT_HPP
#define PORTALGATE_PROXY_PORTALREDIRECT_HPP

#include <string>
#include <string_view>

namespace portalgate::proxy
{

constexpr unsigned g_kStatusFound{ 302U };
constexpr unsigned g_kStatusNetworkAuthRequired{ 511U };

// OS connectivity checks (iOS, macOS, Android) recognised by host or path.
[[nodiscard]] bool isConnectivityProbe(std::string_view host, std::string_view path) noexcept;

// Root domains users commonly type by hand, and their subdomains.
[[nodiscard]] bool isForcedRootDomain(std::string_view host) noexcept;

// 302 for probes and forced roots so captive sheets open at once, 511 otherwise.
[[nodiscard]] unsigned redirectStatusFor(std::string_view host, std::string_view path) noexcept;

// Portal URL carrying the device address as client_ip.
[[nodiscard]] std::string portalUrlFor(std::string_view portalUrl, std::string_view clientAddress);

// Complete response bytes pointing the client at `loginUrl`; the connection closes after it.
[[nodiscard]] std::string buildRedirectResponse(unsigned status, std::string_view loginUrl);

[[nodiscard]] std::string buildBadGatewayResponse();

} // namespace portalgate::proxy

#endif // PORTALGATE_PROXY_PORTALREDIRECT_HPP
