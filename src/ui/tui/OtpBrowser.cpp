#include "OtpBrowser.hpp"
#include "Clipboard.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace otpdeck::ui::tui
{

using otpdeck::core::Action;

OtpBrowser::OtpBrowser(const otpdeck::core::EntryIndex& index, const otpdeck::otp::IOtpProvider& provider,
                       RenderGate& gate, BrowserOptions options)
    : m_provider(provider), m_gate(gate), m_options(std::move(options)),
      m_controller(index, m_options.initialGroup), m_now([] { return std::chrono::system_clock::now(); }),
      m_copy([](std::string_view tool, std::string_view text) { return copyToClipboard(tool, text); })
{
}

int OtpBrowser::run()
{
    m_gate.setInputTimeout(g_kListPollMs);

    if (m_options.directUuid)
    {
        const auto t{ m_controller.revealUuid(*m_options.directUuid) };
        if (t.action == Action::EnterReveal)
        {
            apply(t);
            if (runReveal() == RevealOutcome::Quit || m_options.exitAfterDirect)
            {
                return 0;
            }
        }
        else
        {
            spdlog::warn("browser: no entry with uuid {}", *m_options.directUuid);
        }
    }

    m_gate.markDirty();
    render(nullptr);
    while (!stopRequested())
    {
        const auto event{ m_gate.readInput() };
        const auto t{ m_controller.handle(event) };
        apply(t);

        if (t.action == Action::Quit)
        {
            return 0;
        }
        if (t.action == Action::EnterReveal && runReveal() == RevealOutcome::Quit)
        {
            return 0;
        }
        render(nullptr);
    }
    return 0;
}

OtpBrowser::RevealOutcome OtpBrowser::runReveal()
{
    const auto* entry{ m_controller.revealedEntry() };
    if (entry == nullptr)
    {
        apply(m_controller.handle(otpdeck::core::keyEvent(otpdeck::core::InputKey::Escape)));
        return RevealOutcome::BackToList;
    }

    std::unique_ptr<otpdeck::core::RevealSession> session{};
    try
    {
        session = std::make_unique<otpdeck::core::RevealSession>(*entry, m_provider, m_now());
    }
    catch (const std::exception& e)
    {
        spdlog::error("browser: cannot compute code for {}: {}", entry->uuid, e.what());
        apply(m_controller.handle(otpdeck::core::keyEvent(otpdeck::core::InputKey::Escape)));
        return RevealOutcome::BackToList;
    }
    spdlog::debug("browser: reveal {}", entry->uuid);

    const InputModeGuard pollGuard{ m_gate, g_kRevealPollMs };
    m_gate.markDirty();
    render(session.get());

    while (!stopRequested())
    {
        const auto event{ m_gate.readInput() };
        const auto t{ m_controller.handle(event) };
        apply(t);

        switch (t.action)
        {
        case Action::Quit:
            return RevealOutcome::Quit;
        case Action::ExitReveal:
            m_gate.flushInput();
            return RevealOutcome::BackToList;
        case Action::CopyCode:
            copyCode(*session);
            break;
        default:
            break;
        }

        try
        {
            const auto tick{ session->tick(m_now()) };
            if (tick.codeChanged || tick.countdownChanged)
            {
                m_gate.markCountdown();
            }
        }
        catch (const std::exception& e)
        {
            spdlog::error("browser: cannot refresh code for {}: {}", entry->uuid, e.what());
            apply(m_controller.handle(otpdeck::core::keyEvent(otpdeck::core::InputKey::Escape)));
            return RevealOutcome::BackToList;
        }
        render(session.get());
    }
    return RevealOutcome::Quit;
}

bool OtpBrowser::stopRequested() const noexcept
{
    return m_stop != nullptr && m_stop->load();
}

void OtpBrowser::apply(const otpdeck::core::Transition& t) noexcept
{
    if (t.dirty)
    {
        m_gate.markDirty();
    }
    if (t.fullRedraw)
    {
        m_gate.markResized();
    }
}

void OtpBrowser::render(const otpdeck::core::RevealSession* session)
{
    m_controller.setTerminalRows(m_gate.size().rows);
    m_gate.present(m_controller, session);
}

void OtpBrowser::copyCode(const otpdeck::core::RevealSession& session)
{
    if (m_options.clipboardTool.empty())
    {
        spdlog::debug("browser: copy requested but no clipboard tool configured");
        return;
    }
    if (m_copy(m_options.clipboardTool, session.code()))
    {
        spdlog::info("browser: code for {} copied", session.entry().uuid);
    }
}

} // namespace otpdeck::ui::tui
