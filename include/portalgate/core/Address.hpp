#ifndef INCLUDE_PORTALGATE_CORE_ADDRESS_HPP
#define INCLUDE_PORTALGATE_CORE_ADDRESS_HPP

#include <optional>
#include <string>
#include <string_view>

namespace portalgate::core
{

// True for a textual IPv4 or IPv6 address (no port, no brackets).
[[nodiscard]] bool isWellFormedAddress(std::string_view address) noexcept;

// Canonical text form used as the session key: IPv4-mapped IPv6 becomes plain IPv4,
// IPv6 is lower-cased and compressed. Returns std::nullopt for malformed input.
[[nodiscard]] std::optional<std::string> normalizeAddress(std::string_view address);

} // namespace portalgate::core

#endif // INCLUDE_PORTALGATE_CORE_ADDRESS_HPP
