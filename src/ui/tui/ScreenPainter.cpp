#include "ScreenPainter.hpp"
#include "otpdeck/core/Viewport.hpp"

#include <algorithm>
#include <cstddef>
#include <string>

namespace otpdeck::ui::tui
{
namespace
{

using otpdeck::core::SelectionController;

constexpr int g_kNumberColumn{ 4 };
constexpr int g_kColumnGaps{ 5 };
constexpr int g_kIssuerPercent{ 25 };
constexpr int g_kNamePercent{ 30 };
constexpr int g_kGroupPercent{ 20 };
constexpr int g_kPercent{ 100 };

constexpr int g_kRevealMargin{ 2 };
constexpr int g_kRevealTitleRow{ 1 };
constexpr int g_kRevealIssuerRow{ 3 };
constexpr int g_kRevealHelpRow{ 10 };

constexpr std::string_view g_kListHelp{ "Up/Down: move  Enter: reveal  Ctrl+G: groups  ESC: clear  Ctrl+C: quit" };
constexpr std::string_view g_kGroupHelp{ "Up/Down: move  Enter: select  ESC/Ctrl+G: cancel  type to filter" };
constexpr std::string_view g_kRevealHelp{ "ESC/Backspace: back  c: copy  Ctrl+C: quit" };

[[nodiscard]] constexpr bool isContinuationByte(char c) noexcept
{
    return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U;
}

[[nodiscard]] std::string tableRow(const ColumnLayout& layout, std::string_view number, std::string_view issuer,
                                   std::string_view name, std::string_view code, std::string_view group,
                                   std::string_view note)
{
    std::string line{};
    line += fitText(number, layout.number);
    line += ' ';
    line += fitText(issuer, layout.issuer);
    line += ' ';
    line += fitText(name, layout.name);
    line += ' ';
    line += fitText(code, layout.code);
    line += ' ';
    line += fitText(group, layout.group);
    line += ' ';
    line += fitText(note, layout.note);
    return line;
}

struct RevealFrame final
{
    int top{ 0 };
    int left{ g_kRevealMargin };
    int width{ 0 };
    int textCol{ 0 };
    int textWidth{ 0 };
};

[[nodiscard]] RevealFrame revealFrame(TerminalSize size) noexcept
{
    RevealFrame f{};
    f.width = std::max(g_kRevealMargin * 2, size.cols - g_kRevealMargin * 2);
    f.textCol = f.left + g_kRevealMargin;
    f.textWidth = std::max(0, f.width - g_kRevealMargin * 2);
    return f;
}

} // namespace

ColumnLayout computeColumns(int innerWidth) noexcept
{
    ColumnLayout layout{};
    layout.number = g_kNumberColumn;
    layout.code = static_cast<int>(g_kMaskedCode.size());
    const int rest{ std::max(0, innerWidth - layout.number - layout.code - g_kColumnGaps) };
    layout.issuer = rest * g_kIssuerPercent / g_kPercent;
    layout.name = rest * g_kNamePercent / g_kPercent;
    layout.group = rest * g_kGroupPercent / g_kPercent;
    layout.note = rest - layout.issuer - layout.name - layout.group;
    return layout;
}

std::string fitText(std::string_view text, int width)
{
    if (width <= 0)
    {
        return {};
    }
    std::string out{};
    out.reserve(static_cast<std::size_t>(width));
    int used{ 0 };
    std::size_t i{ 0 };
    while (i < text.size())
    {
        std::size_t next{ i + 1U };
        while (next < text.size() && isContinuationByte(text[next]))
        {
            ++next;
        }
        if (used + 1 > width)
        {
            break;
        }
        out.append(text.substr(i, next - i));
        ++used;
        i = next;
    }
    out.append(static_cast<std::size_t>(width - used), ' ');
    return out;
}

std::string listTitle(const SelectionController& controller)
{
    const auto& state{ controller.state() };
    if (!state.searchTerm.empty())
    {
        return "--- Search: " + state.searchTerm + " ---";
    }
    if (state.activeGroup)
    {
        return "--- Group: " + controller.activeGroupName() + " ---";
    }
    return "--- All OTPs ---";
}

std::string countdownText(const otpdeck::core::RevealSession& session)
{
    if (session.counterBased())
    {
        return "Counter: " + std::to_string(session.counter());
    }
    return "Time to Next: " + std::to_string(session.secondsRemaining()) + "s";
}

void paintList(ITerminal& term, const SelectionController& controller)
{
    const TerminalSize size{ term.size() };
    const int inner{ size.cols - 2 };
    const ColumnLayout layout{ computeColumns(inner) };
    const auto& state{ controller.state() };
    const auto& view{ controller.view() };

    term.drawText(0, 0, fitText(listTitle(controller), size.cols), TextStyle::Bold);
    term.drawBox(1, 0, size.rows - 3, size.cols);
    term.drawText(2, 1, tableRow(layout, "#", "Issuer", "Name", "Code", "Group", "Note"), TextStyle::Bold);
    term.drawText(3, 1, std::string(static_cast<std::size_t>(std::max(0, inner)), '-'), TextStyle::Dim);

    constexpr int kFirstRow{ 4 };
    const int height{ otpdeck::core::listViewportHeight(size.rows) };
    if (view.empty())
    {
        term.drawText(kFirstRow, 1, fitText("No matching entries", inner), TextStyle::Dim);
    }
    for (int i{ 0 }; i < height; ++i)
    {
        const auto idx{ static_cast<std::size_t>(state.scrollOffset + i) };
        if (idx >= view.size())
        {
            break;
        }
        const auto& row{ view.rows[idx] };
        const auto style{ static_cast<int>(idx) == state.selectedRow ? TextStyle::Highlight : TextStyle::Normal };
        term.drawText(kFirstRow + i, 1,
                      tableRow(layout, std::to_string(row.rowNumber), row.entry->issuer, row.entry->name,
                               g_kMaskedCode, row.entry->groupLabel, row.entry->note),
                      style);
    }

    term.drawText(size.rows - 2, 0, fitText(g_kListHelp, size.cols), TextStyle::Dim);
    term.clearLine(size.rows - 1, 0);
    term.drawText(size.rows - 1, 0, "Search: " + state.searchTerm, TextStyle::Normal);
}

void paintGroupSelect(ITerminal& term, const SelectionController& controller)
{
    const TerminalSize size{ term.size() };
    const int inner{ size.cols - 2 };
    const auto& state{ controller.state() };
    const auto& choices{ controller.groupChoices() };

    term.drawText(0, 0, fitText("--- Select Group ---", size.cols), TextStyle::Bold);
    term.drawBox(1, 0, size.rows - 3, size.cols);

    constexpr int kFirstRow{ 2 };
    const int height{ otpdeck::core::groupViewportHeight(size.rows) };
    for (int i{ 0 }; i < height; ++i)
    {
        const auto idx{ static_cast<std::size_t>(state.scrollOffset + i) };
        if (idx >= choices.size())
        {
            break;
        }
        const auto& choice{ choices[idx] };
        const std::string label{ choice.uuid ? choice.label : "-- " + choice.label + " --" };
        const auto style{ static_cast<int>(idx) == state.selectedRow ? TextStyle::Highlight : TextStyle::Normal };
        term.drawText(kFirstRow + i, 1, fitText(label, inner), style);
    }

    term.drawText(size.rows - 2, 0, fitText(g_kGroupHelp, size.cols), TextStyle::Dim);
    term.clearLine(size.rows - 1, 0);
    term.drawText(size.rows - 1, 0, "Group: " + state.searchTerm, TextStyle::Normal);
}

void paintReveal(ITerminal& term, const otpdeck::core::RevealSession& session)
{
    const RevealFrame f{ revealFrame(term.size()) };
    const auto& entry{ session.entry() };

    term.drawBox(f.top, f.left, g_kRevealBoxRows, f.width);
    const std::string& shown{ entry.name.empty() ? entry.issuer : entry.name };
    term.drawText(f.top + g_kRevealTitleRow, f.textCol, fitText("--- Revealed OTP: " + shown + " ---", f.textWidth),
                  TextStyle::Bold);

    int row{ f.top + g_kRevealIssuerRow };
    term.drawText(row++, f.textCol, fitText("Issuer: " + entry.issuer, f.textWidth), TextStyle::Normal);
    term.drawText(row++, f.textCol, fitText("Name:   " + entry.name, f.textWidth), TextStyle::Normal);
    term.drawText(row++, f.textCol, fitText("Group:  " + entry.groupLabel, f.textWidth), TextStyle::Normal);
    term.drawText(row, f.textCol, fitText("Note:   " + entry.note, f.textWidth), TextStyle::Normal);

    paintCountdown(term, session);
    term.drawText(f.top + g_kRevealHelpRow, f.textCol, fitText(g_kRevealHelp, f.textWidth), TextStyle::Dim);
}

void paintCountdown(ITerminal& term, const otpdeck::core::RevealSession& session)
{
    const RevealFrame f{ revealFrame(term.size()) };
    term.drawText(f.top + g_kRevealCodeRow, f.textCol, fitText("OTP Code: " + session.code(), f.textWidth),
                  TextStyle::CodeHighlight);
    term.drawText(f.top + g_kRevealTimeRow, f.textCol, fitText(countdownText(session), f.textWidth),
                  session.lowTime() ? TextStyle::Alert : TextStyle::Normal);
}

void paintTooSmall(ITerminal& term, TerminalSize size)
{
    const std::string notice{ "Terminal too small: need " + std::to_string(otpdeck::core::g_kMinTerminalCols) + "x" +
                              std::to_string(otpdeck::core::g_kMinTerminalRows) };
    term.drawText(std::max(0, size.rows / 2), 0, notice, TextStyle::Alert);
}

} // namespace otpdeck::ui::tui
