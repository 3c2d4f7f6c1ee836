#include "otpdeck/config/AppConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace otpdeck::config
{
namespace
{

using Json = nlohmann::json;

constexpr std::string_view g_kAppDirName{ "otpdeck" };
constexpr int g_kJsonIndent{ 2 };

[[nodiscard]] std::optional<std::string> optionalString(const Json& obj, const char* key)
{
    const auto it{ obj.find(key) };
    if (it == obj.end() || !it->is_string())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

[[nodiscard]] std::filesystem::path envPath(const char* name)
{
    const char* value{ std::getenv(name) };
    if (value == nullptr || *value == '\0')
    {
        return {};
    }
    return std::filesystem::path{ value };
}

} // namespace

std::filesystem::path defaultConfigDir()
{
    if (auto xdg{ envPath("XDG_CONFIG_HOME") }; !xdg.empty())
    {
        return xdg / g_kAppDirName;
    }
    if (auto home{ envPath("HOME") }; !home.empty())
    {
        return home / ".config" / g_kAppDirName;
    }
    return {};
}

AppConfig parseConfig(std::string_view json)
{
    const Json doc = Json::parse(json.begin(), json.end());
    if (!doc.is_object())
    {
        throw std::invalid_argument("config: top level must be an object");
    }

    AppConfig config{};
    if (const auto it{ doc.find("default_color_mode") }; it != doc.end() && it->is_boolean())
    {
        config.defaultColorMode = it->get<bool>();
    }
    config.lastOpenedVault = optionalString(doc, "last_opened_vault");
    config.lastVaultDir = optionalString(doc, "last_vault_dir");
    config.clipboardTool = optionalString(doc, "clipboard_tool").value_or("");
    config.logLevel = optionalString(doc, "log_level").value_or("info");
    return config;
}

std::string serializeConfig(const AppConfig& config)
{
    Json doc = Json::object();
    doc["default_color_mode"] = config.defaultColorMode;
    doc["last_opened_vault"] = config.lastOpenedVault ? Json(*config.lastOpenedVault) : Json(nullptr);
    doc["last_vault_dir"] = config.lastVaultDir ? Json(*config.lastVaultDir) : Json(nullptr);
    doc["clipboard_tool"] = config.clipboardTool;
    doc["log_level"] = config.logLevel;
    return doc.dump(g_kJsonIndent) + "\n";
}

LoadedConfig loadConfig(const std::filesystem::path& file) noexcept
{
    try
    {
        std::error_code ec{};
        if (file.empty() || !std::filesystem::is_regular_file(file, ec) || ec)
        {
            return LoadedConfig{ AppConfig{}, LoadStatus::Missing };
        }

        std::ifstream in{ file };
        if (!in)
        {
            return LoadedConfig{ AppConfig{}, LoadStatus::Malformed };
        }
        std::ostringstream text{};
        text << in.rdbuf();
        return LoadedConfig{ parseConfig(text.str()), LoadStatus::Loaded };
    }
    catch (const std::exception&)
    {
        return LoadedConfig{ AppConfig{}, LoadStatus::Malformed };
    }
}

bool saveConfig(const std::filesystem::path& file, const AppConfig& config) noexcept
{
    try
    {
        std::error_code ec{};
        const auto dir{ file.parent_path() };
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir, ec);
            if (ec)
            {
                return false;
            }
            std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace,
                                         ec);
        }

        const auto tmp{ std::filesystem::path{ file }.concat(".tmp") };
        {
            std::ofstream out{ tmp, std::ios::trunc };
            if (!out)
            {
                return false;
            }
            out << serializeConfig(config);
            if (!out.flush())
            {
                return false;
            }
        }
        std::filesystem::rename(tmp, file, ec);
        return !ec;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

} // namespace otpdeck::config
