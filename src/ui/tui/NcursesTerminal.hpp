#ifndef OTPDECK_UI_TUI_NCURSESTERMINAL_HPP
#define OTPDECK_UI_TUI_NCURSESTERMINAL_HPP

#include "ITerminal.hpp"

namespace otpdeck::ui::tui
{

// Maps a curses key code (KEY_* or a raw byte) to an input event.
[[nodiscard]] otpdeck::core::InputEvent decodeCursesKey(int key) noexcept;

// Owns stdscr from construction to destruction; the destructor restores the terminal.
class NcursesTerminal final : public ITerminal
{
public:
    // Throws TerminalUnavailable when stdin or stdout is not a terminal.
    explicit NcursesTerminal(bool useColor);
    ~NcursesTerminal() override;

    [[nodiscard]] TerminalSize size() const override;

    void clear() override;
    void clearLine(int row, int col) override;
    void drawText(int row, int col, std::string_view text, TextStyle style) override;
    void drawBox(int top, int left, int height, int width) override;
    void present() override;

    void setInputTimeout(int ms) override;
    [[nodiscard]] int inputTimeout() const noexcept override
    {
        return m_timeoutMs;
    }
    [[nodiscard]] otpdeck::core::InputEvent readInput() override;
    void flushInput() override;

private:
    [[nodiscard]] int attributesFor(TextStyle style) const noexcept;

    bool m_color{ false };
    int m_timeoutMs{ -1 };
};

} // namespace otpdeck::ui::tui

#endif // OTPDECK_UI_TUI_NCURSESTERMINAL_HPP
