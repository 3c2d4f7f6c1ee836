#include "otpdeck/otp/OtpParams.hpp"
#include "otpdeck/core/TextUtils.hpp"

namespace otpdeck::otp
{

std::optional<OtpType> parseOtpType(std::string_view s) noexcept
{
    using otpdeck::core::equalsIgnoreCase;
    if (equalsIgnoreCase(s, "totp"))
    {
        return OtpType::Totp;
    }
    if (equalsIgnoreCase(s, "hotp"))
    {
        return OtpType::Hotp;
    }
    if (equalsIgnoreCase(s, "steam"))
    {
        return OtpType::Steam;
    }
    if (equalsIgnoreCase(s, "motp"))
    {
        return OtpType::Motp;
    }
    return std::nullopt;
}

std::optional<otpdeck::crypto::HashAlgorithm> parseHashAlgorithm(std::string_view s) noexcept
{
    using otpdeck::core::equalsIgnoreCase;
    using otpdeck::crypto::HashAlgorithm;
    if (equalsIgnoreCase(s, "SHA1"))
    {
        return HashAlgorithm::Sha1;
    }
    if (equalsIgnoreCase(s, "SHA256"))
    {
        return HashAlgorithm::Sha256;
    }
    if (equalsIgnoreCase(s, "SHA512"))
    {
        return HashAlgorithm::Sha512;
    }
    if (equalsIgnoreCase(s, "MD5"))
    {
        return HashAlgorithm::Md5;
    }
    return std::nullopt;
}

} // namespace otpdeck::otp
