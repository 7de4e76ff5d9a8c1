#ifndef INCLUDE_PORTALGATE_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_PORTALGATE_CRYPTO_ICRYPTOPROVIDER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace portalgate::crypto
{

constexpr std::size_t g_sha256Bytes{ 32 };
constexpr std::size_t g_sessionTokenBytes{ 32 };

using Sha256Digest = std::array<std::uint8_t, g_sha256Bytes>;

// Randomness for session tokens and digests for credential comparison.
class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // CSPRNG. Returns false if the generator could not produce the requested bytes.
    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // Throws std::runtime_error if the digest backend fails.
    [[nodiscard]] virtual Sha256Digest sha256(std::span<const std::byte> data) const = 0;
};

} // namespace portalgate::crypto

#endif // INCLUDE_PORTALGATE_CRYPTO_ICRYPTOPROVIDER_HPP
