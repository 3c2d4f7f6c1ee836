#ifndef OTPDECK_UI_TUI_CONSOLEUTILS_HPP
#define OTPDECK_UI_TUI_CONSOLEUTILS_HPP

#include "otpdeck/security/SecureBuffer.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace otpdeck::ui::tui
{

inline constexpr std::string_view g_kPasswordEnvVar{ "OTPDECK_PASSWORD" };

// mlockall plus no core dumps. Failures are logged, never fatal.
void lockProcessMemory() noexcept;

// Reads one line from std::cin with terminal echo disabled.
[[nodiscard]] otpdeck::security::SecureString readPassword(const std::string& prompt);

// Password from the environment, wiped from the environment block afterwards.
[[nodiscard]] std::optional<otpdeck::security::SecureString> passwordFromEnvironment();

} // namespace otpdeck::ui::tui

#endif // OTPDECK_UI_TUI_CONSOLEUTILS_HPP
