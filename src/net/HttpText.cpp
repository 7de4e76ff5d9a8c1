#include "portalgate/net/HttpText.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

namespace portalgate::net
{
namespace
{

[[nodiscard]] std::optional<std::uint8_t> hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

[[nodiscard]] bool isUnreserved(unsigned char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.' ||
           c == '_' || c == '~';
}

[[nodiscard]] char lower(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // namespace

std::string urlDecode(std::string_view text)
{
    constexpr std::uint8_t kNibbleShift{ 4U };

    std::string out{};
    out.reserve(text.size());
    for (std::size_t i{}; i < text.size(); ++i)
    {
        const char c{ text[i] };
        if (c == '+')
        {
            out.push_back(' ');
            continue;
        }
        if (c == '%' && i + 2U < text.size())
        {
            const auto hi{ hexValue(text[i + 1U]) };
            const auto lo{ hexValue(text[i + 2U]) };
            if (hi.has_value() && lo.has_value())
            {
                out.push_back(static_cast<char>((*hi << kNibbleShift) | *lo));
                i += 2U;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

std::string urlEncode(std::string_view text)
{
    constexpr char kHex[] = "0123456789ABCDEF";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(text.size());
    for (const char ch : text)
    {
        const auto c{ static_cast<unsigned char>(ch) };
        if (isUnreserved(c))
        {
            out.push_back(ch);
            continue;
        }
        out.push_back('%');
        out.push_back(kHex[(c >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[c & kNibbleMask]);
    }
    return out;
}

QueryParams parseQuery(std::string_view query)
{
    QueryParams params{};
    while (!query.empty())
    {
        const auto amp{ query.find('&') };
        const auto pair{ query.substr(0, amp) };
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1U);
        if (pair.empty())
        {
            continue;
        }

        const auto eq{ pair.find('=') };
        auto key{ urlDecode(pair.substr(0, eq)) };
        auto value{ (eq == std::string_view::npos) ? std::string{} : urlDecode(pair.substr(eq + 1U)) };
        if (!key.empty())
        {
            params.try_emplace(std::move(key), std::move(value));
        }
    }
    return params;
}

SplitTarget splitTarget(std::string_view target) noexcept
{
    if (const auto hash{ target.find('#') }; hash != std::string_view::npos)
    {
        target = target.substr(0, hash);
    }
    const auto q{ target.find('?') };
    if (q == std::string_view::npos)
    {
        return SplitTarget{ target, {} };
    }
    return SplitTarget{ target.substr(0, q), target.substr(q + 1U) };
}

std::string htmlEscape(std::string_view text)
{
    std::string out{};
    out.reserve(text.size());
    for (const char c : text)
    {
        switch (c)
        {
        case '&':
            out.append("&amp;");
            break;
        case '<':
            out.append("&lt;");
            break;
        case '>':
            out.append("&gt;");
            break;
        case '"':
            out.append("&quot;");
            break;
        case '\'':
            out.append("&#39;");
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

std::string appendQueryParam(std::string_view url, std::string_view key, std::string_view value)
{
    std::string_view fragment{};
    if (const auto hash{ url.find('#') }; hash != std::string_view::npos)
    {
        fragment = url.substr(hash);
        url = url.substr(0, hash);
    }

    std::string out{ url };
    if (url.find('?') == std::string_view::npos)
    {
        out.push_back('?');
    }
    else if (out.back() != '?' && out.back() != '&')
    {
        out.push_back('&');
    }
    out.append(urlEncode(key));
    out.push_back('=');
    out.append(urlEncode(value));
    out.append(fragment);
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (std::size_t i{}; i < a.size(); ++i)
    {
        if (lower(a[i]) != lower(b[i]))
        {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view text) noexcept
{
    constexpr std::string_view kSpace{ " \t\r\n" };
    const auto first{ text.find_first_not_of(kSpace) };
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last{ text.find_last_not_of(kSpace) };
    return text.substr(first, last - first + 1U);
}

} // namespace portalgate::net
