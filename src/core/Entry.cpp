#include "otpdeck/core/Entry.hpp"
#include "otpdeck/core/TextUtils.hpp"

#include <algorithm>
#include <utility>

namespace otpdeck::core
{

bool Entry::inGroup(std::string_view groupUuid) const noexcept
{
    return std::any_of(groupIds.begin(), groupIds.end(), [groupUuid](const std::string& id) { return id == groupUuid; });
}

EntryIndex::EntryIndex(std::vector<Entry> entries, std::vector<Group> groups)
    : m_entries(std::move(entries)), m_groups(std::move(groups))
{
    for (std::size_t i{}; i < m_entries.size(); ++i)
    {
        Entry& e{ m_entries[i] };
        e.originalIndex = i;

        std::string label{};
        for (const auto& id : e.groupIds)
        {
            const Group* g{ findGroup(id) };
            if (g == nullptr)
            {
                continue;
            }
            if (!label.empty())
            {
                label += ", ";
            }
            label += g->name;
        }
        e.groupLabel = std::move(label);
    }
}

const Entry* EntryIndex::find(std::string_view uuid) const noexcept
{
    const auto it{ std::find_if(m_entries.begin(), m_entries.end(),
                                [uuid](const Entry& e) { return e.uuid == uuid; }) };
    return it == m_entries.end() ? nullptr : &*it;
}

const Group* EntryIndex::findGroup(std::string_view uuid) const noexcept
{
    const auto it{ std::find_if(m_groups.begin(), m_groups.end(), [uuid](const Group& g) { return g.uuid == uuid; }) };
    return it == m_groups.end() ? nullptr : &*it;
}

const Group* EntryIndex::findGroupByName(std::string_view name) const noexcept
{
    const auto it{ std::find_if(m_groups.begin(), m_groups.end(),
                                [name](const Group& g) { return equalsIgnoreCase(g.name, name); }) };
    return it == m_groups.end() ? nullptr : &*it;
}

} // namespace otpdeck::core
