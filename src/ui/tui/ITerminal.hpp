#ifndef OTPDECK_UI_TUI_ITERMINAL_HPP
#define OTPDECK_UI_TUI_ITERMINAL_HPP

#include "otpdeck/core/InputEvent.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace otpdeck::ui::tui
{

enum class TextStyle : std::uint8_t
{
    Normal,
    Bold,
    Dim,
    Highlight,     // selected row
    CodeHighlight, // revealed code
    Alert,         // low remaining time
};

struct TerminalSize final
{
    int rows{ 0 };
    int cols{ 0 };
};

// Raised when no interactive terminal can be set up.
class TerminalUnavailable final : public std::runtime_error
{
public:
    explicit TerminalUnavailable(const std::string& what) : std::runtime_error(what)
    {
    }
};

// Character-cell screen plus keyboard. Drawing is buffered until present().
class ITerminal
{
public:
    ITerminal() = default;
    ITerminal(const ITerminal&) = delete;
    ITerminal& operator=(const ITerminal&) = delete;
    ITerminal(ITerminal&&) = delete;
    ITerminal& operator=(ITerminal&&) = delete;
    virtual ~ITerminal() = default;

    [[nodiscard]] virtual TerminalSize size() const = 0;

    virtual void clear() = 0;
    // Blanks `row` from `col` to the right edge.
    virtual void clearLine(int row, int col) = 0;
    // Text past the right edge is clipped.
    virtual void drawText(int row, int col, std::string_view text, TextStyle style) = 0;
    virtual void drawBox(int top, int left, int height, int width) = 0;
    virtual void present() = 0;

    // Upper bound in milliseconds for readInput(); never blocks indefinitely.
    virtual void setInputTimeout(int ms) = 0;
    [[nodiscard]] virtual int inputTimeout() const noexcept = 0;
    [[nodiscard]] virtual otpdeck::core::InputEvent readInput() = 0;
    // Drops pending keystrokes.
    virtual void flushInput() = 0;
};

} // namespace otpdeck::ui::tui

#endif // OTPDECK_UI_TUI_ITERMINAL_HPP
