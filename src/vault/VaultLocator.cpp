#include "otpdeck/vault/VaultLocator.hpp"

#include <regex>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>

namespace otpdeck::vault
{

bool isVaultFileName(std::string_view fileName)
{
    static const std::regex kPattern{ R"(^aegis-(backup|export)-\d+(-\d+)*\.json$)" };
    return std::regex_match(fileName.begin(), fileName.end(), kPattern);
}

std::optional<std::filesystem::path> findLatestVault(const std::filesystem::path& dir) noexcept
{
    try
    {
        std::error_code ec{};
        if (!std::filesystem::is_directory(dir, ec) || ec)
        {
            return std::nullopt;
        }

        std::optional<std::filesystem::path> best{};
        std::filesystem::file_time_type bestTime{};
        for (std::filesystem::directory_iterator it{ dir, ec }, end{}; !ec && it != end; it.increment(ec))
        {
            const auto& dirEntry{ *it };
            std::error_code entryEc{};
            if (!dirEntry.is_regular_file(entryEc) || entryEc ||
                !isVaultFileName(dirEntry.path().filename().string()))
            {
                continue;
            }
            const auto mtime{ dirEntry.last_write_time(entryEc) };
            if (entryEc)
            {
                continue;
            }
            if (!best || mtime > bestTime)
            {
                best = dirEntry.path();
                bestTime = mtime;
            }
        }
        if (ec)
        {
            spdlog::warn("vault: error while scanning {}: {}", dir.string(), ec.message());
        }
        return best;
    }
    catch (const std::exception& e)
    {
        spdlog::warn("vault: cannot scan {}: {}", dir.string(), e.what());
        return std::nullopt;
    }
}

std::optional<std::filesystem::path> locateVault(const std::optional<std::filesystem::path>& explicitPath,
                                                 const std::optional<std::filesystem::path>& lastOpened,
                                                 const std::vector<std::filesystem::path>& searchDirs)
{
    if (explicitPath)
    {
        return explicitPath;
    }

    std::error_code ec{};
    if (lastOpened && std::filesystem::is_regular_file(*lastOpened, ec) && !ec)
    {
        return lastOpened;
    }

    for (const auto& dir : searchDirs)
    {
        if (auto found{ findLatestVault(dir) })
        {
            return found;
        }
    }
    return std::nullopt;
}

} // namespace otpdeck::vault
