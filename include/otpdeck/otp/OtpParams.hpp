#ifndef INCLUDE_OTPDECK_OTP_OTPPARAMS_HPP
#define INCLUDE_OTPDECK_OTP_OTPPARAMS_HPP

#include "otpdeck/crypto/ICryptoProvider.hpp"
#include "otpdeck/security/SecureBuffer.hpp"
#include <cstdint>
#include <optional>
#include <string_view>

namespace otpdeck::otp
{

enum class OtpType : std::uint8_t
{
    Totp,
    Hotp,
    Steam,
    Motp,
};

inline constexpr std::uint32_t g_kDefaultPeriod{ 30U };
inline constexpr std::uint32_t g_kMinDigits{ 1U };
inline constexpr std::uint32_t g_kMaxDigits{ 10U };

// Everything needed to compute a code for one entry.
struct OtpParams final
{
    OtpType type{ OtpType::Totp };
    otpdeck::crypto::HashAlgorithm algorithm{ otpdeck::crypto::HashAlgorithm::Sha1 };
    std::uint32_t digits{ 6U };
    std::uint32_t period{ g_kDefaultPeriod };
    std::uint64_t counter{ 0U };
    otpdeck::security::SecureBuffer secret;
    otpdeck::security::SecureString pin; // mOTP only
};

[[nodiscard]] std::optional<OtpType> parseOtpType(std::string_view s) noexcept;
[[nodiscard]] std::optional<otpdeck::crypto::HashAlgorithm> parseHashAlgorithm(std::string_view s) noexcept;

} // namespace otpdeck::otp

#endif // INCLUDE_OTPDECK_OTP_OTPPARAMS_HPP
