#include "otpdeck/otp/VaultOtpProvider.hpp"

#include <stdexcept>
#include <utility>

namespace otpdeck::otp
{

VaultOtpProvider::VaultOtpProvider(const otpdeck::crypto::ICryptoProvider& crypto,
                                   std::map<std::string, OtpParams, std::less<>> params)
    : m_generator(crypto), m_params(std::move(params))
{
}

OtpCode VaultOtpProvider::compute(const otpdeck::core::Entry& entry, std::chrono::system_clock::time_point now) const
{
    const auto it{ m_params.find(entry.uuid) };
    if (it == m_params.end())
    {
        throw std::out_of_range("VaultOtpProvider: unknown entry");
    }
    return m_generator.generate(it->second, now);
}

bool VaultOtpProvider::contains(std::string_view uuid) const noexcept
{
    return m_params.find(uuid) != m_params.end();
}

} // namespace otpdeck::otp
