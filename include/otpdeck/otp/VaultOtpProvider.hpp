#ifndef INCLUDE_OTPDECK_OTP_VAULTOTPPROVIDER_HPP
#define INCLUDE_OTPDECK_OTP_VAULTOTPPROVIDER_HPP

#include "otpdeck/crypto/ICryptoProvider.hpp"
#include "otpdeck/otp/IOtpProvider.hpp"
#include "otpdeck/otp/OtpGenerator.hpp"
#include "otpdeck/otp/OtpParams.hpp"
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace otpdeck::otp
{

// Computes codes for vault entries from secrets kept in wiping buffers.
class VaultOtpProvider final : public IOtpProvider
{
public:
    VaultOtpProvider(const otpdeck::crypto::ICryptoProvider& crypto, std::map<std::string, OtpParams, std::less<>> params);

    [[nodiscard]] OtpCode compute(const otpdeck::core::Entry& entry,
                                  std::chrono::system_clock::time_point now) const override;

    [[nodiscard]] bool contains(std::string_view uuid) const noexcept;

private:
    OtpGenerator m_generator;
    std::map<std::string, OtpParams, std::less<>> m_params;
};

} // namespace otpdeck::otp

#endif // INCLUDE_OTPDECK_OTP_VAULTOTPPROVIDER_HPP
