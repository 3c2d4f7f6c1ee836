#include "NcursesTerminal.hpp"

#include <clocale>
#include <curses.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace otpdeck::ui::tui
{
namespace
{

constexpr int g_kEscDelayMs{ 25 };

enum ColorPair : short
{
    PairHighlight = 1,
    PairCode = 2,
    PairAlert = 3,
    PairDim = 4,
};

} // namespace

otpdeck::core::InputEvent decodeCursesKey(int key) noexcept
{
    using otpdeck::core::InputKey;
    using otpdeck::core::keyEvent;
    switch (key)
    {
    case ERR:
        return keyEvent(InputKey::None);
    case KEY_UP:
        return keyEvent(InputKey::Up);
    case KEY_DOWN:
        return keyEvent(InputKey::Down);
    case KEY_PPAGE:
        return keyEvent(InputKey::PageUp);
    case KEY_NPAGE:
        return keyEvent(InputKey::PageDown);
    case KEY_HOME:
        return keyEvent(InputKey::Home);
    case KEY_END:
        return keyEvent(InputKey::End);
    case KEY_ENTER:
        return keyEvent(InputKey::Enter);
    case KEY_BACKSPACE:
        return keyEvent(InputKey::Backspace);
    case KEY_RESIZE:
        return keyEvent(InputKey::Resize);
    default:
        break;
    }
    return otpdeck::core::decodeByte(key);
}

NcursesTerminal::NcursesTerminal(bool useColor)
{
    if (isatty(STDIN_FILENO) == 0 || isatty(STDOUT_FILENO) == 0)
    {
        throw TerminalUnavailable("stdin/stdout is not an interactive terminal");
    }

    std::setlocale(LC_ALL, "");
    if (initscr() == nullptr)
    {
        throw TerminalUnavailable("cannot initialise curses");
    }
    raw();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    set_escdelay(g_kEscDelayMs);

    if (useColor && has_colors())
    {
        start_color();
        use_default_colors();
        init_pair(PairHighlight, COLOR_BLACK, COLOR_CYAN);
        init_pair(PairCode, COLOR_GREEN, -1);
        init_pair(PairAlert, COLOR_RED, -1);
        init_pair(PairDim, COLOR_WHITE, -1);
        m_color = true;
    }
    spdlog::debug("terminal: curses up, color={}", m_color);
}

NcursesTerminal::~NcursesTerminal()
{
    curs_set(1);
    endwin();
}

TerminalSize NcursesTerminal::size() const
{
    int rows{ 0 };
    int cols{ 0 };
    getmaxyx(stdscr, rows, cols);
    return TerminalSize{ rows, cols };
}

void NcursesTerminal::clear()
{
    erase();
}

void NcursesTerminal::clearLine(int row, int col)
{
    move(row, col);
    clrtoeol();
}

int NcursesTerminal::attributesFor(TextStyle style) const noexcept
{
    switch (style)
    {
    case TextStyle::Normal:
        return A_NORMAL;
    case TextStyle::Bold:
        return A_BOLD;
    case TextStyle::Dim:
        return m_color ? static_cast<int>(COLOR_PAIR(PairDim) | A_DIM) : static_cast<int>(A_DIM);
    case TextStyle::Highlight:
        return m_color ? static_cast<int>(COLOR_PAIR(PairHighlight)) : static_cast<int>(A_REVERSE);
    case TextStyle::CodeHighlight:
        return m_color ? static_cast<int>(COLOR_PAIR(PairCode) | A_BOLD) : static_cast<int>(A_BOLD | A_UNDERLINE);
    case TextStyle::Alert:
        return m_color ? static_cast<int>(COLOR_PAIR(PairAlert) | A_BOLD) : static_cast<int>(A_BOLD | A_BLINK);
    }
    return A_NORMAL;
}

void NcursesTerminal::drawText(int row, int col, std::string_view text, TextStyle style)
{
    const TerminalSize s{ size() };
    if (row < 0 || col < 0 || row >= s.rows || col >= s.cols || text.empty())
    {
        return;
    }
    const int room{ s.cols - col };
    const int len{ static_cast<int>(text.size()) < room ? static_cast<int>(text.size()) : room };
    const int attrs{ attributesFor(style) };
    attron(attrs);
    mvaddnstr(row, col, text.data(), len);
    attroff(attrs);
}

void NcursesTerminal::drawBox(int top, int left, int height, int width)
{
    if (height < 2 || width < 2)
    {
        return;
    }
    const int bottom{ top + height - 1 };
    const int right{ left + width - 1 };
    mvhline(top, left + 1, ACS_HLINE, width - 2);
    mvhline(bottom, left + 1, ACS_HLINE, width - 2);
    mvvline(top + 1, left, ACS_VLINE, height - 2);
    mvvline(top + 1, right, ACS_VLINE, height - 2);
    mvaddch(top, left, ACS_ULCORNER);
    mvaddch(top, right, ACS_URCORNER);
    mvaddch(bottom, left, ACS_LLCORNER);
    mvaddch(bottom, right, ACS_LRCORNER);
}

void NcursesTerminal::present()
{
    refresh();
}

void NcursesTerminal::setInputTimeout(int ms)
{
    m_timeoutMs = ms;
    timeout(ms);
}

otpdeck::core::InputEvent NcursesTerminal::readInput()
{
    return decodeCursesKey(getch());
}

void NcursesTerminal::flushInput()
{
    flushinp();
}

} // namespace otpdeck::ui::tui
