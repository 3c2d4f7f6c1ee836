#ifndef INCLUDE_OTPDECK_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_OTPDECK_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "otpdeck/crypto/ICryptoProvider.hpp"
#include <memory>

namespace otpdeck::crypto::providers
{

[[nodiscard]] std::unique_ptr<otpdeck::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace otpdeck::crypto::providers

#endif // INCLUDE_OTPDECK_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
