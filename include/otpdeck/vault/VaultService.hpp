#ifndef INCLUDE_OTPDECK_VAULT_VAULTSERVICE_HPP
#define INCLUDE_OTPDECK_VAULT_VAULTSERVICE_HPP

#include "otpdeck/core/Entry.hpp"
#include "otpdeck/crypto/ICryptoProvider.hpp"
#include "otpdeck/otp/OtpParams.hpp"
#include "otpdeck/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace otpdeck::vault
{

enum class VaultError : std::uint8_t
{
    NotFound,
    IoError,
    MalformedVault,
    NoPasswordSlot,
    UnsupportedKdfParams,
    WrongPassword,
    CryptoError,
};

template <class T> using VaultResult = std::variant<T, VaultError>;

[[nodiscard]] std::string_view describe(VaultError error) noexcept;

// Decrypted vault: display metadata plus the per-entry OTP parameters.
struct VaultContents final
{
    otpdeck::core::EntryIndex index;
    std::map<std::string, otpdeck::otp::OtpParams, std::less<>> otpParams;
    std::size_t skippedEntries{ 0 };
};

// Reads Aegis backups and plain exports. Never writes.
class VaultService final
{
public:
    explicit VaultService(otpdeck::crypto::ICryptoProvider& crypto) noexcept : m_crypto(&crypto)
    {
    }

    // True when the file is an encrypted backup and a password is needed.
    [[nodiscard]] VaultResult<bool> requiresPassword(const std::filesystem::path& vaultFile) const noexcept;

    [[nodiscard]] VaultResult<VaultContents> openVault(const std::filesystem::path& vaultFile,
                                                       const otpdeck::security::SecureString& password) noexcept;

    // Same as openVault() for an already loaded document.
    [[nodiscard]] VaultResult<VaultContents> openVaultText(std::string_view json,
                                                           const otpdeck::security::SecureString& password) noexcept;

private:
    otpdeck::crypto::ICryptoProvider* m_crypto{ nullptr };
};

} // namespace otpdeck::vault

#endif // INCLUDE_OTPDECK_VAULT_VAULTSERVICE_HPP
