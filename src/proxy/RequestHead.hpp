#ifndef PORTALGATE_PROXY_REQUESTHEAD_HPP
#define PORTALGATE_PROXY_REQUESTHEAD_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace portalgate::proxy
{

enum class HeadStatus : std::uint8_t
{
    Complete,
    Incomplete,
    Malformed,
    TooLarge,
};

[[nodiscard]] std::string_view toString(HeadStatus status) noexcept;

// Request line and header fields of one proxied request. Header names keep their case.
struct RequestHead final
{
    std::string method;
    std::string target;
    std::string version;
    std::vector<std::pair<std::string, std::string>> headers;

    // Destination taken from the CONNECT authority, an absolute-form target or Host.
    std::string host;
    std::uint16_t port{ 80 };
    // Target path for response selection ("/" for CONNECT).
    std::string path;

    // Case-insensitive lookup of the first field named `name`.
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const noexcept;
};

struct HeadParse final
{
    HeadStatus status{ HeadStatus::Incomplete };
    RequestHead head;
    // Bytes up to and including the blank line; meaningful only for Complete.
    std::size_t length{ 0U };
};

// Parses the leading request head held in `buffer`. TooLarge when no terminator appears
// within `maxBytes`. Bytes after the head (a body, pipelined data) are not examined.
[[nodiscard]] HeadParse parseRequestHead(std::string_view buffer, std::size_t maxBytes);

struct Authority final
{
    std::string host;
    std::uint16_t port{ 0 };
};

// Splits "host[:port]" or "[v6]:port". Missing port yields `defaultPort`.
[[nodiscard]] std::optional<Authority> parseAuthority(std::string_view text, std::uint16_t defaultPort);

} // namespace portalgate::proxy

#endif // PORTALGATE_PROXY_REQUESTHEAD_HPP
