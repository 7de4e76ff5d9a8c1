#ifndef INCLUDE_PORTALGATE_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_PORTALGATE_SECURITY_SECUREEQUALS_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace portalgate::security
{

// Running time depends on the lengths only, never on where the inputs differ.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> lhs, std::span<const std::byte> rhs) noexcept
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }

    volatile std::uint8_t acc{ 0U };
    for (std::size_t i{}; i < lhs.size(); ++i)
    {
        acc = static_cast<std::uint8_t>(acc | std::to_integer<std::uint8_t>(lhs[i] ^ rhs[i]));
    }
    return acc == 0U;
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs) noexcept
{
    return secureEquals(std::as_bytes(lhs), std::as_bytes(rhs));
}

// For session tokens. A length mismatch returns early; tokens have a fixed length.
[[nodiscard]] inline bool secureEquals(std::string_view lhs, std::string_view rhs) noexcept
{
    return secureEquals(std::as_bytes(std::span<const char>{ lhs.data(), lhs.size() }),
                        std::as_bytes(std::span<const char>{ rhs.data(), rhs.size() }));
}

} // namespace portalgate::security

#endif // INCLUDE_PORTALGATE_SECURITY_SECUREEQUALS_HPP
