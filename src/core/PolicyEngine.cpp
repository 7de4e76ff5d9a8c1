#include "portalgate/core/PolicyEngine.hpp"

#include "portalgate/log/Loggers.hpp"
#include "portalgate/storage/StorageErrors.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>
#include <new>
#include <stdexcept>

namespace portalgate::core
{
namespace
{

[[nodiscard]] std::string lowerCopy(std::string_view s)
{
    std::string out{ s };
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[nodiscard]] std::string_view stripBrackets(std::string_view host) noexcept
{
    if (host.size() >= 2U && host.front() == '[' && host.back() == ']')
    {
        return host.substr(1U, host.size() - 2U);
    }
    return host;
}

[[nodiscard]] std::uint16_t requirePort(std::string_view text)
{
    unsigned int value{};
    const auto* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(text.data(), last, value) };
    if (text.empty() || ec != std::errc{} || ptr != last || value == 0U || value > 65535U)
    {
        throw std::invalid_argument("policy: bad portal host port '" + std::string{ text } + "'");
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace

PortalHost parsePortalHost(std::string_view entry)
{
    PortalHost out{};
    if (!entry.empty() && entry.front() == '[')
    {
        const auto close{ entry.find(']') };
        if (close == std::string_view::npos)
        {
            throw std::invalid_argument("policy: unterminated '[' in portal host '" + std::string{ entry } + "'");
        }
        out.host = lowerCopy(entry.substr(1U, close - 1U));
        const auto rest{ entry.substr(close + 1U) };
        if (!rest.empty())
        {
            if (rest.front() != ':')
            {
                throw std::invalid_argument("policy: bad portal host '" + std::string{ entry } + "'");
            }
            out.port = requirePort(rest.substr(1U));
        }
    }
    else if (const auto colon{ entry.find(':') };
             colon != std::string_view::npos && entry.find(':', colon + 1U) == std::string_view::npos)
    {
        out.host = lowerCopy(entry.substr(0U, colon));
        out.port = requirePort(entry.substr(colon + 1U));
    }
    else
    {
        // No colon, or a bare IPv6 literal.
        out.host = lowerCopy(entry);
    }

    if (out.host.empty())
    {
        throw std::invalid_argument("policy: empty portal host '" + std::string{ entry } + "'");
    }
    return out;
}

std::string_view toString(Action action) noexcept
{
    switch (action)
    {
    case Action::Forward:
        return "forward";
    case Action::RedirectAuth:
        return "redirect-auth";
    case Action::Reject:
        break;
    }
    return "reject";
}

PolicyEngine::PolicyEngine(portalgate::storage::ISessionStore& store, PolicyOptions options)
    : m_store(&store), m_log(portalgate::log::logger("policy"))
{
    m_portalHosts.reserve(options.portalHosts.size());
    for (const auto& entry : options.portalHosts)
    {
        if (!entry.empty())
        {
            m_portalHosts.push_back(parsePortalHost(entry));
        }
    }
}

bool PolicyEngine::isPortalHost(std::string_view host, std::uint16_t port) const noexcept
{
    if (m_portalHosts.empty() || host.empty())
    {
        return false;
    }
    try
    {
        const auto needle{ lowerCopy(stripBrackets(host)) };
        return std::any_of(m_portalHosts.begin(), m_portalHosts.end(),
                           [&](const PortalHost& allowed)
                           { return allowed.host == needle && (!allowed.port.has_value() || *allowed.port == port); });
    }
    catch (const std::bad_alloc&)
    {
        return false;
    }
}

Action PolicyEngine::decide(const PendingRequest& request) const noexcept
{
    if (isPortalHost(request.host, request.port))
    {
        return Action::Forward;
    }

    bool authenticated{ false };
    try
    {
        authenticated = m_store->get(request.sourceAddress).isAuthenticated();
    }
    catch (const portalgate::storage::StoreIoError& e)
    {
        m_log->error("[{}] session lookup failed, rejecting: {}", request.sourceAddress, e.what());
        return Action::Reject;
    }
    catch (const std::invalid_argument& e)
    {
        m_log->warn("[{}] unusable source address, rejecting: {}", request.sourceAddress, e.what());
        return Action::Reject;
    }
    catch (const std::exception& e)
    {
        m_log->error("[{}] session lookup raised, rejecting: {}", request.sourceAddress, e.what());
        return Action::Reject;
    }

    if (authenticated)
    {
        return Action::Forward;
    }
    return (request.scheme == Scheme::Tunnel) ? Action::Reject : Action::RedirectAuth;
}

} // namespace portalgate::core
