#ifndef INCLUDE_OTPDECK_CORE_REVEALSESSION_HPP
#define INCLUDE_OTPDECK_CORE_REVEALSESSION_HPP

#include "otpdeck/core/Entry.hpp"
#include "otpdeck/otp/IOtpProvider.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace otpdeck::core
{

inline constexpr int g_kLowTimeSeconds{ 10 };

struct RevealTick final
{
    bool codeChanged{ false };
    bool countdownChanged{ false };
};

// Code and countdown of the one revealed entry. Lives exactly as long as Reveal mode.
class RevealSession final
{
public:
    using Clock = std::chrono::system_clock;

    // Computes the first code immediately; provider exceptions propagate.
    RevealSession(const Entry& entry, const otpdeck::otp::IOtpProvider& provider, Clock::time_point now);

    RevealSession(const RevealSession&) = delete;
    RevealSession& operator=(const RevealSession&) = delete;
    RevealSession(RevealSession&&) = delete;
    RevealSession& operator=(RevealSession&&) = delete;
    ~RevealSession() = default;

    // Regenerates once the deadline has passed. Counter-based codes never regenerate.
    [[nodiscard]] RevealTick tick(Clock::time_point now);

    [[nodiscard]] const Entry& entry() const noexcept
    {
        return *m_entry;
    }
    [[nodiscard]] const std::string& code() const noexcept
    {
        return m_code.code;
    }
    [[nodiscard]] bool counterBased() const noexcept
    {
        return m_code.counterBased;
    }
    [[nodiscard]] std::uint64_t counter() const noexcept
    {
        return m_code.counter.value_or(0U);
    }

    // Remaining time as of the last tick, never negative.
    [[nodiscard]] std::int64_t msRemaining() const noexcept
    {
        return m_msRemaining;
    }
    [[nodiscard]] int secondsRemaining() const noexcept;
    [[nodiscard]] bool lowTime() const noexcept;

private:
    void regenerate(Clock::time_point now);

    const Entry* m_entry;
    const otpdeck::otp::IOtpProvider* m_provider;
    otpdeck::otp::OtpCode m_code{};
    Clock::time_point m_deadline{};
    std::int64_t m_msRemaining{ 0 };
};

} // namespace otpdeck::core

#endif // INCLUDE_OTPDECK_CORE_REVEALSESSION_HPP
