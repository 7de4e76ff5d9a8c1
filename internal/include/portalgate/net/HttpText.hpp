#ifndef INCLUDE_PORTALGATE_NET_HTTPTEXT_HPP
#define INCLUDE_PORTALGATE_NET_HTTPTEXT_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace portalgate::net
{

using QueryParams = std::map<std::string, std::string, std::less<>>;

// Percent-decoding. '+' becomes a space (form encoding); invalid escapes are kept verbatim.
[[nodiscard]] std::string urlDecode(std::string_view text);

// Encodes everything outside the RFC 3986 unreserved set.
[[nodiscard]] std::string urlEncode(std::string_view text);

// Parses "a=1&b=2" (query strings and form bodies). The first occurrence of a key wins.
[[nodiscard]] QueryParams parseQuery(std::string_view query);

struct SplitTarget final
{
    std::string_view path;
    std::string_view query;
};

// Splits an origin-form request target at '?'. The fragment, if any, is dropped.
[[nodiscard]] SplitTarget splitTarget(std::string_view target) noexcept;

[[nodiscard]] std::string htmlEscape(std::string_view text);

// Adds key=value to a URL, keeping any existing query and fragment in place.
[[nodiscard]] std::string appendQueryParam(std::string_view url, std::string_view key, std::string_view value);

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

} // namespace portalgate::net

#endif // INCLUDE_PORTALGATE_NET_HTTPTEXT_HPP
