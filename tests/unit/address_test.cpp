#include "portalgate/core/Address.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <string>

using portalgate::core::isWellFormedAddress;
using portalgate::core::normalizeAddress;

TEST(Address, AcceptsIpv4AndIpv6)
{
    EXPECT_TRUE(isWellFormedAddress("10.0.0.5"));
    EXPECT_TRUE(isWellFormedAddress("::1"));
    EXPECT_TRUE(isWellFormedAddress("fe80::1"));
    EXPECT_TRUE(isWellFormedAddress("::ffff:192.168.1.20"));
}

TEST(Address, RejectsMalformedInput)
{
    EXPECT_FALSE(isWellFormedAddress(""));
    EXPECT_FALSE(isWellFormedAddress("10.0.0"));
    EXPECT_FALSE(isWellFormedAddress("10.0.0.256"));
    EXPECT_FALSE(isWellFormedAddress("example.com"));
    EXPECT_FALSE(isWellFormedAddress("10.0.0.5:80"));
    EXPECT_FALSE(isWellFormedAddress("[::1]"));
    EXPECT_FALSE(isWellFormedAddress(std::string(128U, '1')));
}

TEST(Address, NormalizesIpv4MappedIpv6ToIpv4)
{
    EXPECT_EQ(normalizeAddress("::ffff:192.168.1.20"), std::optional<std::string>{ "192.168.1.20" });
    EXPECT_EQ(normalizeAddress("::FFFF:10.0.0.5"), std::optional<std::string>{ "10.0.0.5" });
}

TEST(Address, CompressesAndLowercasesIpv6)
{
    EXPECT_EQ(normalizeAddress("FE80:0000:0000:0000:0000:0000:0000:0001"), std::optional<std::string>{ "fe80::1" });
    EXPECT_EQ(normalizeAddress("::1"), std::optional<std::string>{ "::1" });
}

TEST(Address, KeepsCanonicalIpv4)
{
    EXPECT_EQ(normalizeAddress("127.0.0.1"), std::optional<std::string>{ "127.0.0.1" });
}

TEST(Address, NormalizeRejectsMalformedInput)
{
    EXPECT_FALSE(normalizeAddress("").has_value());
    EXPECT_FALSE(normalizeAddress("not-an-ip").has_value());
    EXPECT_FALSE(normalizeAddress(" 10.0.0.5").has_value());
}
