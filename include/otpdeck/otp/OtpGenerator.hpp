#ifndef INCLUDE_OTPDECK_OTP_OTPGENERATOR_HPP
#define INCLUDE_OTPDECK_OTP_OTPGENERATOR_HPP

#include "otpdeck/crypto/ICryptoProvider.hpp"
#include "otpdeck/otp/IOtpProvider.hpp"
#include "otpdeck/otp/OtpParams.hpp"
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace otpdeck::otp
{

inline constexpr std::string_view g_kSteamAlphabet{ "23456789BCDFGHJKMNPQRTVWXY" };

// Milliseconds until the next period boundary, in [1, period * 1000].
[[nodiscard]] std::int64_t msUntilNext(std::uint32_t periodSeconds, std::chrono::system_clock::time_point now) noexcept;

// RFC 4226 dynamic truncation of an HMAC result to a 31-bit value.
[[nodiscard]] std::uint32_t dynamicTruncate(std::span<const std::uint8_t> mac);

// HOTP, TOTP, Steam and mOTP codes on top of a crypto provider.
// Invalid parameters throw std::invalid_argument.
class OtpGenerator final
{
public:
    explicit OtpGenerator(const otpdeck::crypto::ICryptoProvider& crypto) noexcept : m_crypto(crypto)
    {
    }

    [[nodiscard]] std::string hotp(const OtpParams& params, std::uint64_t counter) const;
    [[nodiscard]] std::string totp(const OtpParams& params, std::chrono::system_clock::time_point now) const;
    [[nodiscard]] std::string steam(const OtpParams& params, std::chrono::system_clock::time_point now) const;
    [[nodiscard]] std::string motp(const OtpParams& params, std::chrono::system_clock::time_point now) const;

    [[nodiscard]] OtpCode generate(const OtpParams& params, std::chrono::system_clock::time_point now) const;

    // Checks that generate() can succeed for these parameters.
    [[nodiscard]] static bool supports(const OtpParams& params) noexcept;

private:
    [[nodiscard]] std::uint32_t truncatedHmac(const OtpParams& params, std::uint64_t counter) const;

    const otpdeck::crypto::ICryptoProvider& m_crypto;
};

} // namespace otpdeck::otp

#endif // INCLUDE_OTPDECK_OTP_OTPGENERATOR_HPP
