#ifndef INCLUDE_OTPDECK_VAULT_VAULTLOCATOR_HPP
#define INCLUDE_OTPDECK_VAULT_VAULTLOCATOR_HPP

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace otpdeck::vault
{

// Matches aegis-backup-20240101.json, aegis-export-20240101-120000.json and similar.
[[nodiscard]] bool isVaultFileName(std::string_view fileName);

// Most recently modified regular file in `dir` whose name is a vault file name.
[[nodiscard]] std::optional<std::filesystem::path> findLatestVault(const std::filesystem::path& dir) noexcept;

// First hit wins: explicit path, then remembered file, then each search directory in order.
[[nodiscard]] std::optional<std::filesystem::path>
locateVault(const std::optional<std::filesystem::path>& explicitPath,
            const std::optional<std::filesystem::path>& lastOpened,
            const std::vector<std::filesystem::path>& searchDirs);

} // namespace otpdeck::vault

#endif // INCLUDE_OTPDECK_VAULT_VAULTLOCATOR_HPP
