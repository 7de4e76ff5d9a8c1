#include "portalgate/security/SecureEquals.hpp"

#include "portalgate/crypto/ICryptoProvider.hpp"
#include <cstddef>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using portalgate::security::secureEquals;

TEST(SecureEquals, LengthMismatchNeverMatches)
{
    const std::vector<std::byte> shorter(4U, std::byte{ 0x5A });
    const std::vector<std::byte> longer(5U, std::byte{ 0x5A });
    EXPECT_FALSE(secureEquals(std::span<const std::byte>{ shorter }, std::span<const std::byte>{ longer }));
}

TEST(SecureEquals, DetectsDifferenceInAnyPosition)
{
    const std::vector<std::byte> base(16U, std::byte{ 0x11 });
    for (std::size_t i{}; i < base.size(); ++i)
    {
        auto other{ base };
        other[i] = std::byte{ 0x10 };
        EXPECT_FALSE(secureEquals(std::span<const std::byte>{ base }, std::span<const std::byte>{ other })) << i;
    }
    EXPECT_TRUE(secureEquals(std::span<const std::byte>{ base }, std::span<const std::byte>{ base }));
}

TEST(SecureEquals, ComparesDigests)
{
    portalgate::crypto::Sha256Digest a{};
    portalgate::crypto::Sha256Digest b{};
    EXPECT_TRUE(secureEquals(std::span<const std::uint8_t>{ a }, std::span<const std::uint8_t>{ b }));

    b.back() = 0x80U;
    EXPECT_FALSE(secureEquals(std::span<const std::uint8_t>{ a }, std::span<const std::uint8_t>{ b }));
}

TEST(SecureEquals, ComparesTokens)
{
    const std::string issued(64U, 'c');
    EXPECT_TRUE(secureEquals(std::string_view{ issued }, std::string_view{ std::string(64U, 'c') }));
    EXPECT_FALSE(secureEquals(std::string_view{ issued }, std::string_view{ std::string(64U, 'C') }));
    EXPECT_FALSE(secureEquals(std::string_view{ issued }, std::string_view{ "cccc" }));
    EXPECT_TRUE(secureEquals(std::string_view{}, std::string_view{}));
}
