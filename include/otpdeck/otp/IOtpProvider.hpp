#ifndef INCLUDE_OTPDECK_OTP_IOTPPROVIDER_HPP
#define INCLUDE_OTPDECK_OTP_IOTPPROVIDER_HPP

#include "otpdeck/core/Entry.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace otpdeck::otp
{

struct OtpCode final
{
    std::string code;
    std::int64_t msUntilNext{ 0 }; // 0 for counter-based codes
    bool counterBased{ false };
    std::optional<std::uint64_t> counter;
};

class IOtpProvider
{
public:
    IOtpProvider() = default;
    IOtpProvider(const IOtpProvider&) = delete;
    IOtpProvider& operator=(const IOtpProvider&) = delete;
    IOtpProvider(IOtpProvider&&) = delete;
    IOtpProvider& operator=(IOtpProvider&&) = delete;
    virtual ~IOtpProvider() = default;

    // Free of side effects; each call returns the code valid at `now`.
    // Throws std::out_of_range for an entry the provider does not know.
    [[nodiscard]] virtual OtpCode compute(const otpdeck::core::Entry& entry,
                                          std::chrono::system_clock::time_point now) const = 0;
};

} // namespace otpdeck::otp

#endif // INCLUDE_OTPDECK_OTP_IOTPPROVIDER_HPP
