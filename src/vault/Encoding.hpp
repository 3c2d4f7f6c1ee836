#ifndef OTPDECK_SRC_VAULT_ENCODING_HPP
#define OTPDECK_SRC_VAULT_ENCODING_HPP

#include "otpdeck/security/SecureBuffer.hpp"
#include <optional>
#include <string_view>

namespace otpdeck::vault::detail
{

// All decoders return std::nullopt on any character outside their alphabet.

[[nodiscard]] std::optional<otpdeck::security::SecureBuffer> decodeHex(std::string_view text);

// Standard alphabet; trailing '=' padding is optional.
[[nodiscard]] std::optional<otpdeck::security::SecureBuffer> decodeBase64(std::string_view text);

// RFC 4648 alphabet, case-insensitive; spaces and trailing '=' are ignored.
[[nodiscard]] std::optional<otpdeck::security::SecureBuffer> decodeBase32(std::string_view text);

} // namespace otpdeck::vault::detail

#endif // OTPDECK_SRC_VAULT_ENCODING_HPP
