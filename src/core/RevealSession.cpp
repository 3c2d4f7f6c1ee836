#include "otpdeck/core/RevealSession.hpp"

#include <algorithm>

namespace otpdeck::core
{

namespace
{
constexpr std::int64_t g_kMsPerSecond{ 1000 };

[[nodiscard]] std::int64_t msBetween(RevealSession::Clock::time_point from, RevealSession::Clock::time_point to) noexcept
{
    return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}
} // namespace

RevealSession::RevealSession(const Entry& entry, const otpdeck::otp::IOtpProvider& provider, Clock::time_point now)
    : m_entry(&entry), m_provider(&provider)
{
    regenerate(now);
}

RevealTick RevealSession::tick(Clock::time_point now)
{
    RevealTick result{};
    if (m_code.counterBased)
    {
        return result;
    }

    const int before{ secondsRemaining() };
    if (msBetween(now, m_deadline) <= 0)
    {
        const std::string previous{ m_code.code };
        regenerate(now);
        result.codeChanged = previous != m_code.code;
        result.countdownChanged = true;
        return result;
    }

    m_msRemaining = std::max<std::int64_t>(0, msBetween(now, m_deadline));
    result.countdownChanged = secondsRemaining() != before;
    return result;
}

int RevealSession::secondsRemaining() const noexcept
{
    return static_cast<int>(std::max<std::int64_t>(0, m_msRemaining) / g_kMsPerSecond);
}

bool RevealSession::lowTime() const noexcept
{
    return !m_code.counterBased && secondsRemaining() < g_kLowTimeSeconds;
}

void RevealSession::regenerate(Clock::time_point now)
{
    m_code = m_provider->compute(*m_entry, now);

    m_msRemaining = std::max<std::int64_t>(0, m_code.msUntilNext);
    m_deadline = now + std::chrono::milliseconds{ m_msRemaining };
}

} // namespace otpdeck::core
