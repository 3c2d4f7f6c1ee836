#ifndef OTPDECK_UI_TUI_SCREENPAINTER_HPP
#define OTPDECK_UI_TUI_SCREENPAINTER_HPP

#include "ITerminal.hpp"
#include "otpdeck/core/RevealSession.hpp"
#include "otpdeck/core/SelectionController.hpp"
#include <string>
#include <string_view>

namespace otpdeck::ui::tui
{

inline constexpr std::string_view g_kMaskedCode{ "******" };

struct ColumnLayout final
{
    int number{ 0 };
    int issuer{ 0 };
    int name{ 0 };
    int code{ 0 };
    int group{ 0 };
    int note{ 0 };
};

// Fixed shares of the inner box width: Issuer 25%, Name 30%, Group 20%, Note takes the rest.
[[nodiscard]] ColumnLayout computeColumns(int innerWidth) noexcept;

// Truncates or pads to exactly `width` columns. Never splits a UTF-8 sequence.
[[nodiscard]] std::string fitText(std::string_view text, int width);

[[nodiscard]] std::string listTitle(const otpdeck::core::SelectionController& controller);
[[nodiscard]] std::string countdownText(const otpdeck::core::RevealSession& session);

// Row offsets inside the reveal box, relative to the top border.
inline constexpr int g_kRevealCodeRow{ 8 };
inline constexpr int g_kRevealTimeRow{ 9 };
inline constexpr int g_kRevealBoxRows{ 12 };

void paintList(ITerminal& term, const otpdeck::core::SelectionController& controller);
void paintGroupSelect(ITerminal& term, const otpdeck::core::SelectionController& controller);
void paintReveal(ITerminal& term, const otpdeck::core::RevealSession& session);
// Redraws only the code and remaining-time lines.
void paintCountdown(ITerminal& term, const otpdeck::core::RevealSession& session);
void paintTooSmall(ITerminal& term, TerminalSize size);

} // namespace otpdeck::ui::tui

#endif // OTPDECK_UI_TUI_SCREENPAINTER_HPP
