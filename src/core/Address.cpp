#include "portalgate/core/Address.hpp"

#include <arpa/inet.h>
#include <array>
#include <cstdint>
#include <cstring>
#include <netinet/in.h>

namespace portalgate::core
{
namespace
{

constexpr std::size_t g_kMaxAddressText{ INET6_ADDRSTRLEN };

[[nodiscard]] bool copyToCString(std::string_view in, std::array<char, g_kMaxAddressText + 1U>& out) noexcept
{
    if (in.empty() || in.size() > g_kMaxAddressText)
    {
        return false;
    }
    std::memcpy(out.data(), in.data(), in.size());
    out[in.size()] = '\0';
    return true;
}

[[nodiscard]] bool isV4Mapped(const in6_addr& addr) noexcept
{
    constexpr std::array<std::uint8_t, 12> kPrefix{ 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xFFU, 0xFFU };
    return std::memcmp(addr.s6_addr, kPrefix.data(), kPrefix.size()) == 0;
}

} // namespace

bool isWellFormedAddress(std::string_view address) noexcept
{
    std::array<char, g_kMaxAddressText + 1U> text{};
    if (!copyToCString(address, text))
    {
        return false;
    }

    in_addr v4{};
    if (::inet_pton(AF_INET, text.data(), &v4) == 1)
    {
        return true;
    }
    in6_addr v6{};
    return ::inet_pton(AF_INET6, text.data(), &v6) == 1;
}

std::optional<std::string> normalizeAddress(std::string_view address)
{
    std::array<char, g_kMaxAddressText + 1U> text{};
    if (!copyToCString(address, text))
    {
        return std::nullopt;
    }

    std::array<char, g_kMaxAddressText + 1U> out{};

    in_addr v4{};
    if (::inet_pton(AF_INET, text.data(), &v4) == 1)
    {
        if (::inet_ntop(AF_INET, &v4, out.data(), static_cast<socklen_t>(out.size())) == nullptr)
        {
            return std::nullopt;
        }
        return std::string{ out.data() };
    }

    in6_addr v6{};
    if (::inet_pton(AF_INET6, text.data(), &v6) != 1)
    {
        return std::nullopt;
    }

    if (isV4Mapped(v6))
    {
        in_addr mapped{};
        std::memcpy(&mapped.s_addr, &v6.s6_addr[12], sizeof(mapped.s_addr));
        if (::inet_ntop(AF_INET, &mapped, out.data(), static_cast<socklen_t>(out.size())) == nullptr)
        {
            return std::nullopt;
        }
        return std::string{ out.data() };
    }

    if (::inet_ntop(AF_INET6, &v6, out.data(), static_cast<socklen_t>(out.size())) == nullptr)
    {
        return std::nullopt;
    }
    return std::string{ out.data() };
}

} // namespace portalgate::core
