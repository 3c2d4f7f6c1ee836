#include "otpdeck/otp/OtpGenerator.hpp"
#include "otpdeck/security/ScopeWipe.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace otpdeck::otp
{

namespace
{

constexpr std::int64_t g_kMsPerSecond{ 1000 };
constexpr std::size_t g_kCounterBytes{ 8U };
constexpr std::size_t g_kMd5HexChars{ 32U };

[[nodiscard]] std::uint64_t timeStep(std::uint32_t period, std::chrono::system_clock::time_point now) noexcept
{
    const auto seconds{ std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count() };
    if (seconds <= 0 || period == 0U)
    {
        return 0U;
    }
    return static_cast<std::uint64_t>(seconds) / period;
}

[[nodiscard]] std::array<std::byte, g_kCounterBytes> bigEndian(std::uint64_t v) noexcept
{
    constexpr unsigned kBitsPerByte{ 8U };
    std::array<std::byte, g_kCounterBytes> out{};
    for (std::size_t i{}; i < g_kCounterBytes; ++i)
    {
        out[g_kCounterBytes - 1U - i] = static_cast<std::byte>(v & 0xFFU);
        v >>= kBitsPerByte;
    }
    return out;
}

[[nodiscard]] std::string padDecimal(std::uint64_t value, std::uint32_t digits)
{
    std::string s{ std::to_string(value) };
    if (s.size() < digits)
    {
        s.insert(0, digits - s.size(), '0');
    }
    return s;
}

[[nodiscard]] std::uint64_t pow10(std::uint32_t exponent) noexcept
{
    constexpr std::uint64_t kBase{ 10U };
    std::uint64_t v{ 1U };
    for (std::uint32_t i{}; i < exponent; ++i)
    {
        v *= kBase;
    }
    return v;
}

[[nodiscard]] std::string hexLower(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

void requireSupported(const OtpParams& params)
{
    if (!OtpGenerator::supports(params))
    {
        throw std::invalid_argument("otp: unsupported parameters");
    }
}

} // namespace

std::int64_t msUntilNext(std::uint32_t periodSeconds, std::chrono::system_clock::time_point now) noexcept
{
    const std::int64_t periodMs{ static_cast<std::int64_t>(periodSeconds == 0U ? g_kDefaultPeriod : periodSeconds) *
                                 g_kMsPerSecond };
    const auto nowMs{ std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() };
    std::int64_t into{ static_cast<std::int64_t>(nowMs) % periodMs };
    if (into < 0)
    {
        into += periodMs;
    }
    return periodMs - into;
}

std::uint32_t dynamicTruncate(std::span<const std::uint8_t> mac)
{
    constexpr std::size_t kWindow{ 4U };
    constexpr std::uint8_t kOffsetMask{ 0x0FU };
    constexpr std::uint8_t kSignMask{ 0x7FU };
    if (mac.size() < kWindow + kOffsetMask + 1U)
    {
        throw std::invalid_argument("dynamicTruncate: mac too short");
    }
    const std::size_t offset{ static_cast<std::size_t>(mac.back() & kOffsetMask) };
    return (static_cast<std::uint32_t>(mac[offset] & kSignMask) << 24U) |
           (static_cast<std::uint32_t>(mac[offset + 1U]) << 16U) |
           (static_cast<std::uint32_t>(mac[offset + 2U]) << 8U) | static_cast<std::uint32_t>(mac[offset + 3U]);
}

bool OtpGenerator::supports(const OtpParams& params) noexcept
{
    if (params.secret.empty() || params.digits < g_kMinDigits || params.digits > g_kMaxDigits)
    {
        return false;
    }
    if (params.type != OtpType::Hotp && params.period == 0U)
    {
        return false;
    }
    if (params.type == OtpType::Motp)
    {
        return params.digits <= g_kMd5HexChars;
    }
    // Dynamic truncation needs a 20-byte MAC.
    return params.algorithm != otpdeck::crypto::HashAlgorithm::Md5;
}

std::uint32_t OtpGenerator::truncatedHmac(const OtpParams& params, std::uint64_t counter) const
{
    const auto message{ bigEndian(counter) };
    auto mac{ m_crypto.hmac(params.algorithm, otpdeck::security::asSpan(params.secret),
                            std::span<const std::byte>{ message }) };
    auto wipeMac{ otpdeck::security::scopeWipe(mac) };
    return dynamicTruncate(otpdeck::security::asSpan(mac));
}

std::string OtpGenerator::hotp(const OtpParams& params, std::uint64_t counter) const
{
    requireSupported(params);
    const std::uint32_t value{ truncatedHmac(params, counter) };
    return padDecimal(value % pow10(params.digits), params.digits);
}

std::string OtpGenerator::totp(const OtpParams& params, std::chrono::system_clock::time_point now) const
{
    return hotp(params, timeStep(params.period, now));
}

std::string OtpGenerator::steam(const OtpParams& params, std::chrono::system_clock::time_point now) const
{
    requireSupported(params);
    std::uint32_t value{ truncatedHmac(params, timeStep(params.period, now)) };
    const auto radix{ static_cast<std::uint32_t>(g_kSteamAlphabet.size()) };

    std::string code{};
    code.reserve(params.digits);
    for (std::uint32_t i{}; i < params.digits; ++i)
    {
        code.push_back(g_kSteamAlphabet[value % radix]);
        value /= radix;
    }
    return code;
}

std::string OtpGenerator::motp(const OtpParams& params, std::chrono::system_clock::time_point now) const
{
    requireSupported(params);
    otpdeck::security::SecureString material{ otpdeck::security::secureStringFrom(
        std::to_string(timeStep(params.period, now))) };
    auto wipeMaterial{ otpdeck::security::scopeWipe(material) };

    std::string secretHex{ hexLower(otpdeck::security::asSpan(params.secret)) };
    auto wipeHex{ otpdeck::security::scopeWipe(secretHex) };
    material.insert(material.end(), secretHex.begin(), secretHex.end());
    material.insert(material.end(), params.pin.begin(), params.pin.end());

    const auto digest{ m_crypto.digest(otpdeck::crypto::HashAlgorithm::Md5, otpdeck::security::asBytes(material)) };
    std::string hex{ hexLower(std::span<const std::uint8_t>{ digest }) };
    if (hex.size() < params.digits)
    {
        throw std::invalid_argument("motp: digest shorter than digits");
    }
    hex.resize(params.digits);
    return hex;
}

OtpCode OtpGenerator::generate(const OtpParams& params, std::chrono::system_clock::time_point now) const
{
    switch (params.type)
    {
    case OtpType::Hotp:
        return OtpCode{ hotp(params, params.counter), 0, true, params.counter };
    case OtpType::Steam:
        return OtpCode{ steam(params, now), msUntilNext(params.period, now), false, std::nullopt };
    case OtpType::Motp:
        return OtpCode{ motp(params, now), msUntilNext(params.period, now), false, std::nullopt };
    case OtpType::Totp:
        break;
    }
    return OtpCode{ totp(params, now), msUntilNext(params.period, now), false, std::nullopt };
}

} // namespace otpdeck::otp
