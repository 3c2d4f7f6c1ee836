#include "RenderGate.hpp"
#include "ScreenPainter.hpp"
#include "otpdeck/core/Viewport.hpp"

#include <stdexcept>
#include <utility>

namespace otpdeck::ui::tui
{

RenderGate::RenderGate(std::unique_ptr<ITerminal> terminal) : m_terminal(std::move(terminal))
{
    if (!m_terminal)
    {
        throw std::invalid_argument("RenderGate: null terminal");
    }
}

RedrawKind RenderGate::pending(const otpdeck::core::SelectionController& controller,
                               const otpdeck::core::RevealSession* session) const noexcept
{
    if (m_dirty || m_resized)
    {
        return RedrawKind::Full;
    }
    if (m_countdown && session != nullptr && controller.state().mode == otpdeck::core::Mode::Reveal)
    {
        return RedrawKind::Countdown;
    }
    return RedrawKind::None;
}

RedrawKind RenderGate::present(const otpdeck::core::SelectionController& controller,
                               const otpdeck::core::RevealSession* session)
{
    const RedrawKind kind{ pending(controller, session) };
    if (kind == RedrawKind::None)
    {
        m_countdown = false;
        return kind;
    }

    const TerminalSize s{ m_terminal->size() };
    if (otpdeck::core::terminalTooSmall(s.rows, s.cols))
    {
        clearFlags();
        if (kind == RedrawKind::Countdown)
        {
            // The notice is already on screen.
            return RedrawKind::None;
        }
        m_terminal->clear();
        paintTooSmall(*m_terminal, s);
        m_terminal->present();
        return RedrawKind::Full;
    }

    if (kind == RedrawKind::Countdown)
    {
        paintCountdown(*m_terminal, *session);
    }
    else
    {
        m_terminal->clear();
        switch (controller.state().mode)
        {
        case otpdeck::core::Mode::List:
            paintList(*m_terminal, controller);
            break;
        case otpdeck::core::Mode::GroupSelect:
            paintGroupSelect(*m_terminal, controller);
            break;
        case otpdeck::core::Mode::Reveal:
            if (session != nullptr)
            {
                paintReveal(*m_terminal, *session);
            }
            else
            {
                paintList(*m_terminal, controller);
            }
            break;
        }
    }
    m_terminal->present();
    clearFlags();
    return kind;
}

void RenderGate::clearFlags() noexcept
{
    m_dirty = false;
    m_resized = false;
    m_countdown = false;
}

} // namespace otpdeck::ui::tui
