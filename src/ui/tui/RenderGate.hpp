#ifndef OTPDECK_UI_TUI_RENDERGATE_HPP
#define OTPDECK_UI_TUI_RENDERGATE_HPP

#include "ITerminal.hpp"
#include "otpdeck/core/RevealSession.hpp"
#include "otpdeck/core/SelectionController.hpp"
#include <cstdint>
#include <memory>

namespace otpdeck::ui::tui
{

enum class RedrawKind : std::uint8_t
{
    None,
    Countdown,
    Full,
};

// Sole writer to the terminal. Nothing is drawn unless a flag asks for it.
class RenderGate final
{
public:
    explicit RenderGate(std::unique_ptr<ITerminal> terminal);

    void markDirty() noexcept
    {
        m_dirty = true;
    }
    void markResized() noexcept
    {
        m_resized = true;
    }
    void markCountdown() noexcept
    {
        m_countdown = true;
    }

    [[nodiscard]] RedrawKind pending(const otpdeck::core::SelectionController& controller,
                                     const otpdeck::core::RevealSession* session) const noexcept;

    // Draws whatever is pending, then clears every flag. Returns what was drawn.
    RedrawKind present(const otpdeck::core::SelectionController& controller,
                       const otpdeck::core::RevealSession* session);

    [[nodiscard]] TerminalSize size() const
    {
        return m_terminal->size();
    }
    [[nodiscard]] otpdeck::core::InputEvent readInput()
    {
        return m_terminal->readInput();
    }
    void setInputTimeout(int ms)
    {
        m_terminal->setInputTimeout(ms);
    }
    [[nodiscard]] int inputTimeout() const noexcept
    {
        return m_terminal->inputTimeout();
    }
    void flushInput()
    {
        m_terminal->flushInput();
    }

private:
    void clearFlags() noexcept;

    std::unique_ptr<ITerminal> m_terminal;
    bool m_dirty{ false };
    bool m_resized{ false };
    bool m_countdown{ false };
};

// Switches the input poll timeout for a scope and restores the previous one on exit.
class InputModeGuard final
{
public:
    InputModeGuard(RenderGate& gate, int timeoutMs) : m_gate(gate), m_previous(gate.inputTimeout())
    {
        m_gate.setInputTimeout(timeoutMs);
    }
    InputModeGuard(const InputModeGuard&) = delete;
    InputModeGuard& operator=(const InputModeGuard&) = delete;
    InputModeGuard(InputModeGuard&&) = delete;
    InputModeGuard& operator=(InputModeGuard&&) = delete;
    ~InputModeGuard()
    {
        m_gate.setInputTimeout(m_previous);
    }

private:
    RenderGate& m_gate;
    int m_previous;
};

} // namespace otpdeck::ui::tui

#endif // OTPDECK_UI_TUI_RENDERGATE_HPP
