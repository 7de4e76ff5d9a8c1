#include "portalgate/crypto/providers/OpenSslProviderFactory.hpp"

#include <climits>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <span>
#include <stdexcept>

namespace portalgate::crypto::providers
{
namespace
{

using EvpMdPtr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

EvpMdPtr fetchSha256()
{
    return EvpMdPtr{ EVP_MD_fetch(nullptr, "SHA256", nullptr), &EVP_MD_free };
}

class OpenSslCryptoProvider final : public portalgate::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_sha256{ fetchSha256() }
    {
        if (!m_sha256)
        {
            throw std::runtime_error("crypto: OpenSSL SHA256 not available");
        }
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        std::uint8_t* outPtr{ out.data() };
        std::size_t remaining{ out.size() };

        constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(INT_MAX) };
        while (remaining > 0U)
        {
            const std::size_t chunk{ (remaining > kMaxChunk) ? kMaxChunk : remaining };
            if (RAND_bytes(outPtr, static_cast<int>(chunk)) != 1)
            {
                return false;
            }
            remaining -= chunk;
            outPtr += chunk;
        }
        return true;
    }

    [[nodiscard]] Sha256Digest sha256(std::span<const std::byte> data) const override
    {
        EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex2(ctx.get(), m_sha256.get(), nullptr) != 1)
        {
            throw std::runtime_error("sha256: EVP_DigestInit_ex2 failed");
        }
        if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
        {
            throw std::runtime_error("sha256: EVP_DigestUpdate failed");
        }

        Sha256Digest out{};
        unsigned int outLen{ 0U };
        if (EVP_DigestFinal_ex(ctx.get(), out.data(), &outLen) != 1 || outLen != out.size())
        {
            throw std::runtime_error("sha256: EVP_DigestFinal_ex failed");
        }
        return out;
    }

private:
    EvpMdPtr m_sha256;
};

} // namespace

[[nodiscard]] std::unique_ptr<portalgate::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace portalgate::crypto::providers
