#ifndef INCLUDE_OTPDECK_CORE_ENTRY_HPP
#define INCLUDE_OTPDECK_CORE_ENTRY_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace otpdeck::core
{

struct Group final
{
    std::string uuid;
    std::string name;
};

// Display metadata of one vault entry. Secrets never live here.
struct Entry final
{
    std::string uuid;
    std::string issuer;
    std::string name;
    std::vector<std::string> groupIds;
    std::string groupLabel;
    std::string note;
    std::size_t originalIndex{ 0 };

    [[nodiscard]] bool inGroup(std::string_view groupUuid) const noexcept;
};

// Immutable snapshot of the decrypted vault, in vault order.
class EntryIndex final
{
public:
    EntryIndex() = default;

    // Assigns originalIndex and resolves group names into groupLabel.
    // Group references that do not resolve are kept as ids but not labelled.
    EntryIndex(std::vector<Entry> entries, std::vector<Group> groups);

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept
    {
        return m_entries;
    }
    [[nodiscard]] const std::vector<Group>& groups() const noexcept
    {
        return m_groups;
    }
    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_entries.size();
    }
    [[nodiscard]] bool empty() const noexcept
    {
        return m_entries.empty();
    }

    [[nodiscard]] const Entry* find(std::string_view uuid) const noexcept;
    [[nodiscard]] const Group* findGroup(std::string_view uuid) const noexcept;

    // Case-insensitive lookup by display name.
    [[nodiscard]] const Group* findGroupByName(std::string_view name) const noexcept;

private:
    std::vector<Entry> m_entries;
    std::vector<Group> m_groups;
};

} // namespace otpdeck::core

#endif // INCLUDE_OTPDECK_CORE_ENTRY_HPP
