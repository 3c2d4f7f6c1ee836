#ifndef INCLUDE_OTPDECK_CONFIG_APPCONFIG_HPP
#define INCLUDE_OTPDECK_CONFIG_APPCONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace otpdeck::config
{

inline constexpr std::string_view g_kConfigFileName{ "config.json" };
inline constexpr std::string_view g_kLogFileName{ "otpdeck.log" };

struct AppConfig final
{
    bool defaultColorMode{ true };
    std::optional<std::string> lastOpenedVault;
    std::optional<std::string> lastVaultDir;
    std::string clipboardTool;
    std::string logLevel{ "info" };
};

enum class LoadStatus : std::uint8_t
{
    Loaded,
    Missing,   // defaults used
    Malformed, // defaults used
};

struct LoadedConfig final
{
    AppConfig config;
    LoadStatus status{ LoadStatus::Missing };
};

// $XDG_CONFIG_HOME/otpdeck, else $HOME/.config/otpdeck. Empty when neither is set.
[[nodiscard]] std::filesystem::path defaultConfigDir();

[[nodiscard]] AppConfig parseConfig(std::string_view json);
[[nodiscard]] std::string serializeConfig(const AppConfig& config);

// Never throws; unreadable or invalid files yield the defaults.
[[nodiscard]] LoadedConfig loadConfig(const std::filesystem::path& file) noexcept;

// Creates the parent directory with owner-only permissions.
[[nodiscard]] bool saveConfig(const std::filesystem::path& file, const AppConfig& config) noexcept;

} // namespace otpdeck::config

#endif // INCLUDE_OTPDECK_CONFIG_APPCONFIG_HPP
