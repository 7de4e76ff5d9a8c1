#include "portalgate/core/PendingRequest.hpp"

namespace portalgate::core
{

Scheme classifyScheme(std::string_view method) noexcept
{
    return (method == "CONNECT") ? Scheme::Tunnel : Scheme::Plain;
}

std::string_view toString(Scheme scheme) noexcept
{
    return (scheme == Scheme::Tunnel) ? "tunnel" : "plain";
}

} // namespace portalgate::core
