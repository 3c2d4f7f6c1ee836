#ifndef INCLUDE_OTPDECK_CORE_FILTERENGINE_HPP
#define INCLUDE_OTPDECK_CORE_FILTERENGINE_HPP

#include "otpdeck/core/Entry.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace otpdeck::core
{

struct ViewRow final
{
    const Entry* entry{ nullptr };
    std::size_t rowNumber{ 0 }; // 1-based, contiguous
};

// Borrowed rows; valid as long as the EntryIndex they were built from.
struct FilteredView final
{
    std::vector<ViewRow> rows;
    std::optional<int> jumpRow;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return rows.size();
    }
    [[nodiscard]] bool empty() const noexcept
    {
        return rows.empty();
    }
};

// Separator that cannot be typed into the search prompt.
inline constexpr char g_kFieldSeparator{ '\x1f' };

// Joined, searchable text of one entry.
[[nodiscard]] std::string searchHaystack(const Entry& entry);

// Pure function of its inputs.
// A numeric term inside [1, n] of the group-restricted view leaves the view unfiltered
// and sets jumpRow; otherwise the term is a case-insensitive substring filter.
[[nodiscard]] FilteredView filterEntries(const EntryIndex& index, std::string_view searchTerm,
                                         const std::optional<std::string>& activeGroup);

} // namespace otpdeck::core

#endif // INCLUDE_OTPDECK_CORE_FILTERENGINE_HPP
