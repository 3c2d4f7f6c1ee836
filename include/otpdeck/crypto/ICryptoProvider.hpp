#ifndef INCLUDE_OTPDECK_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_OTPDECK_CRYPTO_ICRYPTOPROVIDER_HPP

#include "otpdeck/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace otpdeck::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

// AES-256-GCM sealed data as stored in Aegis slots and the vault body.
struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

struct ScryptParams final
{
    std::uint64_t n{ 0 };
    std::uint32_t r{ 0 };
    std::uint32_t p{ 0 };
};

enum class HashAlgorithm : std::uint8_t
{
    Sha1,
    Sha256,
    Sha512,
    Md5,
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Derives a slot key from the vault password.
    // Unsafe or malformed parameters throw std::invalid_argument.
    [[nodiscard]] virtual otpdeck::security::SecureBuffer deriveScryptKey(std::span<const std::byte> password,
                                                                          std::span<const std::uint8_t> salt,
                                                                          const ScryptParams& params,
                                                                          std::size_t outBytes) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AES-256-GCM without associated data, 12-byte nonce.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                              std::span<const std::byte> plainText) = 0;

    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual std::optional<otpdeck::security::SecureBuffer> aeadDecrypt(std::span<const std::uint8_t> key,
                                                                                     const AeadBox& box) = 0;

    [[nodiscard]] virtual otpdeck::security::SecureBuffer hmac(HashAlgorithm algorithm, std::span<const std::uint8_t> key,
                                                               std::span<const std::byte> message) const = 0;

    [[nodiscard]] virtual std::vector<std::uint8_t> digest(HashAlgorithm algorithm,
                                                           std::span<const std::byte> data) const = 0;
};

} // namespace otpdeck::crypto

#endif // INCLUDE_OTPDECK_CRYPTO_ICRYPTOPROVIDER_HPP
