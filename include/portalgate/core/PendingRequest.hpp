#ifndef INCLUDE_PORTALGATE_CORE_PENDINGREQUEST_HPP
#define INCLUDE_PORTALGATE_CORE_PENDINGREQUEST_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace portalgate::core
{

enum class Scheme : std::uint8_t
{
    Plain,
    Tunnel,
};

// Tunnel for the tunnel-establishment method (CONNECT), Plain for every other method.
[[nodiscard]] Scheme classifyScheme(std::string_view method) noexcept;

[[nodiscard]] std::string_view toString(Scheme scheme) noexcept;

// The in-flight connection being classified. Lives for one interception only.
struct PendingRequest final
{
    std::string method;
    std::string target;
    std::string host;
    std::uint16_t port{ 80 };
    Scheme scheme{ Scheme::Plain };
    std::string sourceAddress;
    std::string userAgent;
    std::string accept;
};

} // namespace portalgate::core

#endif // INCLUDE_PORTALGATE_CORE_PENDINGREQUEST_HPP
