#ifndef INCLUDE_PORTALGATE_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_PORTALGATE_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "portalgate/crypto/ICryptoProvider.hpp"
#include <memory>

namespace portalgate::crypto::providers
{

[[nodiscard]] std::unique_ptr<portalgate::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace portalgate::crypto::providers

#endif // INCLUDE_PORTALGATE_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
