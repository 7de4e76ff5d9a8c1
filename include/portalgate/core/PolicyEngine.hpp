#ifndef INCLUDE_PORTALGATE_CORE_POLICYENGINE_HPP
#define INCLUDE_PORTALGATE_CORE_POLICYENGINE_HPP

#include "portalgate/core/PendingRequest.hpp"
#include "portalgate/storage/ISessionStore.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <spdlog/logger.h>
#include <string>
#include <string_view>
#include <vector>

namespace portalgate::core
{

enum class Action : std::uint8_t
{
    Forward,
    RedirectAuth,
    Reject,
};

[[nodiscard]] std::string_view toString(Action action) noexcept;

struct PolicyOptions final
{
    // Hosts of the portal itself, as "host" or "host:port" ("[v6]:port" for IPv6). Requests
    // to them pass without a session so that an unauthenticated device can load the login
    // page through the proxy. An entry without a port matches every port.
    std::vector<std::string> portalHosts;
};

struct PortalHost final
{
    std::string host;
    std::optional<std::uint16_t> port;
};

// Splits one allow-list entry; host is lowercased and unbracketed.
// Throws std::invalid_argument on an empty host or a bad port.
[[nodiscard]] PortalHost parsePortalHost(std::string_view entry);

class PolicyEngine final
{
public:
    // Throws std::invalid_argument when a portal host entry cannot be parsed.
    explicit PolicyEngine(portalgate::storage::ISessionStore& store, PolicyOptions options = {});

    // Reads the session store once and never writes anything else.
    // Fails closed: a storage error or a malformed source address yields Reject.
    [[nodiscard]] Action decide(const PendingRequest& request) const noexcept;

    [[nodiscard]] bool isPortalHost(std::string_view host, std::uint16_t port) const noexcept;

private:
    portalgate::storage::ISessionStore* m_store{ nullptr };
    std::vector<PortalHost> m_portalHosts;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace portalgate::core

#endif // INCLUDE_PORTALGATE_CORE_POLICYENGINE_HPP
