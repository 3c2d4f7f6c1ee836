#include "ConsoleUtils.hpp"
#include "Logging.hpp"
#include "NcursesTerminal.hpp"
#include "OtpBrowser.hpp"
#include "RenderGate.hpp"
#include "otpdeck/config/AppConfig.hpp"
#include "otpdeck/crypto/providers/OpenSslProviderFactory.hpp"
#include "otpdeck/otp/VaultOtpProvider.hpp"
#include "otpdeck/security/ScopeWipe.hpp"
#include "otpdeck/vault/VaultLocator.hpp"
#include "otpdeck/vault/VaultService.hpp"

#include <CLI/CLI.hpp>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <variant>
#include <vector>

namespace
{

constexpr int g_kExitOk{ 0 };
constexpr int g_kExitFailure{ 1 };
constexpr int g_kExitUsage{ 2 };
constexpr int g_kMaxPasswordAttempts{ 3 };

std::atomic<bool> g_stopRequested{ false };

void onTerminationSignal(int /*signal*/)
{
    g_stopRequested.store(true);
}

void installSignalHandlers() noexcept
{
    struct sigaction action
    {
    };
    action.sa_handler = &onTerminationSignal;
    sigemptyset(&action.sa_mask);
    for (const int sig : { SIGINT, SIGTERM })
    {
        if (sigaction(sig, &action, nullptr) != 0)
        {
            spdlog::warn("main: cannot install handler for signal {}", sig);
        }
    }
}

struct CliOptions final
{
    std::string vaultPath;
    std::string vaultDir{ "." };
    std::string uuid;
    std::string group;
    bool noColor{ false };
};

[[nodiscard]] otpdeck::vault::VaultResult<otpdeck::vault::VaultContents>
unlockVault(otpdeck::vault::VaultService& service, const std::filesystem::path& file)
{
    using otpdeck::vault::VaultError;

    const auto needsPassword{ service.requiresPassword(file) };
    if (const auto* err{ std::get_if<VaultError>(&needsPassword) })
    {
        return *err;
    }
    if (!std::get<bool>(needsPassword))
    {
        return service.openVault(file, otpdeck::security::SecureString{});
    }

    if (auto envPassword{ otpdeck::ui::tui::passwordFromEnvironment() })
    {
        auto wipeEnv{ otpdeck::security::scopeWipe(*envPassword) };
        spdlog::info("main: using password from {}", otpdeck::ui::tui::g_kPasswordEnvVar);
        return service.openVault(file, *envPassword);
    }

    for (int attempt{ 1 }; attempt <= g_kMaxPasswordAttempts; ++attempt)
    {
        auto password{ otpdeck::ui::tui::readPassword("Password for " + file.filename().string() + ": ") };
        auto wipePassword{ otpdeck::security::scopeWipe(password) };

        auto result{ service.openVault(file, password) };
        const auto* err{ std::get_if<VaultError>(&result) };
        if (err == nullptr || *err != VaultError::WrongPassword)
        {
            return result;
        }
        spdlog::warn("main: wrong password, attempt {}/{}", attempt, g_kMaxPasswordAttempts);
        std::cerr << "Wrong password.\n";
    }
    return VaultError::WrongPassword;
}

void rememberVault(const std::filesystem::path& configFile, otpdeck::config::AppConfig config,
                   const std::filesystem::path& vaultFile)
{
    std::error_code ec{};
    const auto absolute{ std::filesystem::absolute(vaultFile, ec) };
    const auto& chosen{ ec ? vaultFile : absolute };
    config.lastOpenedVault = chosen.string();
    config.lastVaultDir = chosen.parent_path().string();
    if (!otpdeck::config::saveConfig(configFile, config))
    {
        spdlog::warn("config: could not save {}", configFile.string());
    }
}

} // namespace

int main(int argc, char** argv)
{
    CLI::App app{ "otpdeck: browse an Aegis vault and reveal one-time codes" };
    CliOptions opts{};
    app.add_option("vault", opts.vaultPath, "Aegis vault file (default: newest aegis-backup/export file found)");
    app.add_option("-d,--vault-dir", opts.vaultDir, "Directory searched for vault files")->capture_default_str();
    app.add_option("-u,--uuid", opts.uuid, "Reveal this entry immediately");
    app.add_option("-g,--group", opts.group, "Start with this group selected (case-insensitive)");
    app.add_flag("--no-color", opts.noColor, "Disable colors");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e) == 0 ? g_kExitOk : g_kExitUsage;
    }

    try
    {
        otpdeck::ui::tui::lockProcessMemory();

        const auto configDir{ otpdeck::config::defaultConfigDir() };
        const auto configFile{ configDir.empty() ? std::filesystem::path{}
                                                 : configDir / otpdeck::config::g_kConfigFileName };
        const auto loaded{ otpdeck::config::loadConfig(configFile) };
        const auto logFile{ configDir.empty() ? std::filesystem::path{} : configDir / otpdeck::config::g_kLogFileName };
        if (!otpdeck::ui::tui::initLogging(logFile, loaded.config.logLevel))
        {
            std::cerr << "warning: logging disabled\n";
        }
        if (loaded.status == otpdeck::config::LoadStatus::Malformed)
        {
            spdlog::warn("config: {} is malformed, using defaults", configFile.string());
        }

        auto crypto{ otpdeck::crypto::providers::makeOpenSslCryptoProvider() };
        otpdeck::vault::VaultService service{ *crypto };

        std::vector<std::filesystem::path> searchDirs{ std::filesystem::path{ opts.vaultDir } };
        if (!configDir.empty())
        {
            searchDirs.push_back(configDir);
        }
        std::optional<std::filesystem::path> explicitPath{};
        if (!opts.vaultPath.empty())
        {
            explicitPath = std::filesystem::path{ opts.vaultPath };
        }
        std::optional<std::filesystem::path> lastOpened{};
        if (loaded.config.lastOpenedVault)
        {
            lastOpened = std::filesystem::path{ *loaded.config.lastOpenedVault };
        }

        const auto vaultFile{ otpdeck::vault::locateVault(explicitPath, lastOpened, searchDirs) };
        if (!vaultFile)
        {
            std::cerr << "fatal: no vault file found in " << opts.vaultDir << '\n';
            return g_kExitFailure;
        }
        spdlog::info("main: opening {}", vaultFile->string());

        auto opened{ unlockVault(service, *vaultFile) };
        if (const auto* err{ std::get_if<otpdeck::vault::VaultError>(&opened) })
        {
            spdlog::error("main: {}: {}", vaultFile->string(), otpdeck::vault::describe(*err));
            std::cerr << "fatal: " << otpdeck::vault::describe(*err) << '\n';
            return g_kExitFailure;
        }
        auto contents{ std::get<otpdeck::vault::VaultContents>(std::move(opened)) };
        if (!configFile.empty())
        {
            rememberVault(configFile, loaded.config, *vaultFile);
        }

        otpdeck::ui::tui::BrowserOptions options{};
        options.clipboardTool = loaded.config.clipboardTool;
        if (!opts.group.empty())
        {
            if (const auto* group{ contents.index.findGroupByName(opts.group) })
            {
                options.initialGroup = group->uuid;
            }
            else
            {
                spdlog::warn("main: unknown group '{}', showing all entries", opts.group);
                std::cerr << "warning: unknown group '" << opts.group << "', showing All OTPs\n";
            }
        }
        if (!opts.uuid.empty())
        {
            options.directUuid = opts.uuid;
            options.exitAfterDirect = opts.group.empty();
        }

        const otpdeck::otp::VaultOtpProvider provider{ *crypto, std::move(contents.otpParams) };
        const bool useColor{ !opts.noColor && loaded.config.defaultColorMode };

        installSignalHandlers();
        int exitCode{ g_kExitOk };
        {
            otpdeck::ui::tui::RenderGate gate{ std::make_unique<otpdeck::ui::tui::NcursesTerminal>(useColor) };
            gate.flushInput();
            otpdeck::ui::tui::OtpBrowser browser{ contents.index, provider, gate, options };
            browser.setStopFlag(&g_stopRequested);
            exitCode = browser.run();
        }
        spdlog::info("main: exit {}", exitCode);
        return exitCode;
    }
    catch (const otpdeck::ui::tui::TerminalUnavailable& e)
    {
        spdlog::error("main: {}", e.what());
        std::cerr << "fatal: " << e.what() << '\n';
        return g_kExitFailure;
    }
    catch (const std::exception& e)
    {
        spdlog::error("main: {}", e.what());
        std::cerr << "fatal: " << e.what() << '\n';
        return g_kExitFailure;
    }
}
