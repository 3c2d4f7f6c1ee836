#ifndef OTPDECK_UI_TUI_OTPBROWSER_HPP
#define OTPDECK_UI_TUI_OTPBROWSER_HPP

#include "RenderGate.hpp"
#include "otpdeck/core/Entry.hpp"
#include "otpdeck/core/RevealSession.hpp"
#include "otpdeck/core/SelectionController.hpp"
#include "otpdeck/otp/IOtpProvider.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace otpdeck::ui::tui
{

inline constexpr int g_kListPollMs{ 100 };
inline constexpr int g_kRevealPollMs{ 50 };

struct BrowserOptions final
{
    std::optional<std::string> initialGroup; // group uuid
    std::optional<std::string> directUuid;
    // With a direct uuid, leave the program when the reveal ends instead of showing the list.
    bool exitAfterDirect{ false };
    std::string clipboardTool;
};

// Drives the list and reveal loops: one bounded input wait per iteration, state settled before drawing.
class OtpBrowser final
{
public:
    using NowFn = std::function<std::chrono::system_clock::time_point()>;
    using CopyFn = std::function<bool(std::string_view tool, std::string_view text)>;

    OtpBrowser(const otpdeck::core::EntryIndex& index, const otpdeck::otp::IOtpProvider& provider, RenderGate& gate,
               BrowserOptions options);

    // Test seams.
    void setClock(NowFn now)
    {
        m_now = std::move(now);
    }
    void setClipboard(CopyFn copy)
    {
        m_copy = std::move(copy);
    }
    // Checked once per iteration; set from a signal handler.
    void setStopFlag(const std::atomic<bool>* stop) noexcept
    {
        m_stop = stop;
    }

    // Returns when the user quits. The result is the process exit code.
    [[nodiscard]] int run();

    [[nodiscard]] const otpdeck::core::SelectionController& controller() const noexcept
    {
        return m_controller;
    }

private:
    enum class RevealOutcome : std::uint8_t
    {
        BackToList,
        Quit,
    };

    [[nodiscard]] RevealOutcome runReveal();
    [[nodiscard]] bool stopRequested() const noexcept;
    void apply(const otpdeck::core::Transition& t) noexcept;
    void render(const otpdeck::core::RevealSession* session);
    void copyCode(const otpdeck::core::RevealSession& session);

    const otpdeck::otp::IOtpProvider& m_provider;
    RenderGate& m_gate;
    BrowserOptions m_options;
    otpdeck::core::SelectionController m_controller;
    NowFn m_now;
    CopyFn m_copy;
    const std::atomic<bool>* m_stop{ nullptr };
};

} // namespace otpdeck::ui::tui

#endif // OTPDECK_UI_TUI_OTPBROWSER_HPP
