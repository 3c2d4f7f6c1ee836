#ifndef OTPDECK_UI_TUI_LOGGING_HPP
#define OTPDECK_UI_TUI_LOGGING_HPP

#include <filesystem>
#include <string_view>

namespace otpdeck::ui::tui
{

// Routes the default spdlog logger to a file, since curses owns the terminal.
// When the file cannot be opened, logging is discarded and false is returned.
// An unrecognised level logs at info with a warning.
[[nodiscard]] bool initLogging(const std::filesystem::path& logFile, std::string_view level) noexcept;

} // namespace otpdeck::ui::tui

#endif // OTPDECK_UI_TUI_LOGGING_HPP
