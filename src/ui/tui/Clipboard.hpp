#ifndef OTPDECK_UI_TUI_CLIPBOARD_HPP
#define OTPDECK_UI_TUI_CLIPBOARD_HPP

#include <string>
#include <string_view>
#include <vector>

namespace otpdeck::ui::tui
{

// Whitespace-separated argv; quoting is not supported.
[[nodiscard]] std::vector<std::string> splitCommandLine(std::string_view commandLine);

// Runs the tool with `text` on its stdin. True when it exits with status 0.
// The tool's stdout and stderr are discarded so they cannot scribble over the screen.
[[nodiscard]] bool copyToClipboard(std::string_view tool, std::string_view text) noexcept;

} // namespace otpdeck::ui::tui

#endif // OTPDECK_UI_TUI_CLIPBOARD_HPP
