#include "otpdeck/core/FilterEngine.hpp"
#include "otpdeck/core/TextUtils.hpp"

namespace otpdeck::core
{

std::string searchHaystack(const Entry& entry)
{
    std::string text{};
    text.reserve(entry.issuer.size() + entry.name.size() + entry.groupLabel.size() + entry.note.size() + 3U);
    text += entry.issuer;
    text += g_kFieldSeparator;
    text += entry.name;
    text += g_kFieldSeparator;
    text += entry.groupLabel;
    text += g_kFieldSeparator;
    text += entry.note;
    return text;
}

FilteredView filterEntries(const EntryIndex& index, std::string_view searchTerm,
                           const std::optional<std::string>& activeGroup)
{
    std::vector<const Entry*> scoped{};
    scoped.reserve(index.size());
    for (const auto& e : index.entries())
    {
        if (!activeGroup.has_value() || e.inGroup(*activeGroup))
        {
            scoped.push_back(&e);
        }
    }

    FilteredView view{};
    const auto appendRow{ [&view](const Entry* e) { view.rows.push_back(ViewRow{ e, view.rows.size() + 1U }); } };

    if (!searchTerm.empty())
    {
        if (const auto number{ parseDecimal(searchTerm) }; number.has_value())
        {
            const auto n{ static_cast<long long>(scoped.size()) };
            if (*number >= 1 && *number <= n)
            {
                view.rows.reserve(scoped.size());
                for (const Entry* e : scoped)
                {
                    appendRow(e);
                }
                view.jumpRow = static_cast<int>(*number - 1);
                return view;
            }
        }

        for (const Entry* e : scoped)
        {
            if (containsIgnoreCase(searchHaystack(*e), searchTerm))
            {
                appendRow(e);
            }
        }
        return view;
    }

    view.rows.reserve(scoped.size());
    for (const Entry* e : scoped)
    {
        appendRow(e);
    }
    return view;
}

} // namespace otpdeck::core
