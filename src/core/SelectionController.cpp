#include "otpdeck/core/SelectionController.hpp"
#include "otpdeck/core/TextUtils.hpp"
#include "otpdeck/core/Viewport.hpp"

#include <algorithm>
#include <utility>

namespace otpdeck::core
{

SelectionController::SelectionController(const EntryIndex& index, std::optional<std::string> initialGroup)
    : m_index(&index)
{
    m_state.activeGroup = std::move(initialGroup);
    applySearch();
}

Transition SelectionController::handle(const InputEvent& event)
{
    if (event.key == InputKey::Interrupt)
    {
        return Transition{ Action::Quit, false, false };
    }
    if (event.key == InputKey::Resize)
    {
        settle();
        return Transition{ Action::None, true, true };
    }

    Transition t{};
    switch (m_state.mode)
    {
    case Mode::List:
        t = handleList(event);
        break;
    case Mode::GroupSelect:
        t = handleGroupSelect(event);
        break;
    case Mode::Reveal:
        t = handleReveal(event);
        break;
    }
    settle();
    return t;
}

Transition SelectionController::revealUuid(std::string_view uuid)
{
    const Entry* entry{ m_index->find(uuid) };
    if (entry == nullptr)
    {
        return Transition{};
    }

    const auto row{ std::find_if(m_view.rows.begin(), m_view.rows.end(),
                                 [entry](const ViewRow& r) { return r.entry == entry; }) };
    if (row != m_view.rows.end())
    {
        m_state.selectedRow = static_cast<int>(row->rowNumber) - 1;
    }
    m_state.mode = Mode::Reveal;
    m_state.revealedUuid = entry->uuid;
    settle();
    return Transition{ Action::EnterReveal, true, true };
}

void SelectionController::setTerminalRows(int rows) noexcept
{
    m_listHeight = listViewportHeight(rows);
    m_groupHeight = groupViewportHeight(rows);
    settle();
}

int SelectionController::viewportHeight() const noexcept
{
    return m_state.mode == Mode::GroupSelect ? m_groupHeight : m_listHeight;
}

const Entry* SelectionController::selectedEntry() const noexcept
{
    if (m_state.selectedRow < 0 || static_cast<std::size_t>(m_state.selectedRow) >= m_view.size())
    {
        return nullptr;
    }
    return m_view.rows[static_cast<std::size_t>(m_state.selectedRow)].entry;
}

const Entry* SelectionController::revealedEntry() const noexcept
{
    if (!m_state.revealedUuid.has_value())
    {
        return nullptr;
    }
    return m_index->find(*m_state.revealedUuid);
}

std::string SelectionController::activeGroupName() const
{
    if (!m_state.activeGroup.has_value())
    {
        return {};
    }
    const Group* g{ m_index->findGroup(*m_state.activeGroup) };
    return g == nullptr ? std::string{} : g->name;
}

Transition SelectionController::handleList(const InputEvent& event)
{
    switch (event.key)
    {
    case InputKey::Printable:
        m_state.searchTerm.push_back(event.ch);
        applySearch();
        return Transition{ Action::None, true, false };

    case InputKey::Backspace:
        if (m_state.searchTerm.empty())
        {
            return Transition{};
        }
        m_state.searchTerm.pop_back();
        applySearch();
        return Transition{ Action::None, true, false };

    case InputKey::Up:
    case InputKey::Down:
    case InputKey::PageUp:
    case InputKey::PageDown:
    case InputKey::Home:
    case InputKey::End:
        if (!moveCursor(event.key, static_cast<int>(m_view.size())))
        {
            return Transition{};
        }
        m_state.cursorMoved = true;
        return Transition{ Action::None, true, false };

    case InputKey::Enter:
    {
        if (!revealAllowed())
        {
            return Transition{};
        }
        const Entry* entry{ selectedEntry() };
        if (entry == nullptr)
        {
            return Transition{};
        }
        m_state.mode = Mode::Reveal;
        m_state.revealedUuid = entry->uuid;
        return Transition{ Action::EnterReveal, true, true };
    }

    case InputKey::Escape:
        m_state.searchTerm.clear();
        m_state.activeGroup.reset();
        applySearch();
        return Transition{ Action::None, true, false };

    case InputKey::GroupSelect:
        m_state.mode = Mode::GroupSelect;
        m_state.searchTerm.clear();
        m_state.selectedRow = 0;
        m_state.scrollOffset = 0;
        rebuildGroupChoices();
        return Transition{ Action::None, true, true };

    default:
        return Transition{};
    }
}

Transition SelectionController::handleGroupSelect(const InputEvent& event)
{
    switch (event.key)
    {
    case InputKey::Printable:
        m_state.searchTerm.push_back(event.ch);
        rebuildGroupChoices();
        m_state.selectedRow = 0;
        return Transition{ Action::None, true, false };

    case InputKey::Backspace:
        if (m_state.searchTerm.empty())
        {
            return Transition{};
        }
        m_state.searchTerm.pop_back();
        rebuildGroupChoices();
        m_state.selectedRow = 0;
        return Transition{ Action::None, true, false };

    case InputKey::Up:
    case InputKey::Down:
    case InputKey::PageUp:
    case InputKey::PageDown:
    case InputKey::Home:
    case InputKey::End:
        return Transition{ Action::None, moveCursor(event.key, static_cast<int>(m_groupChoices.size())), false };

    case InputKey::Enter:
    {
        const auto idx{ static_cast<std::size_t>(std::max(0, m_state.selectedRow)) };
        if (idx < m_groupChoices.size())
        {
            m_state.activeGroup = m_groupChoices[idx].uuid;
        }
        returnToList();
        return Transition{ Action::None, true, true };
    }

    case InputKey::Escape:
    case InputKey::GroupSelect:
        m_state.activeGroup.reset();
        returnToList();
        return Transition{ Action::None, true, true };

    default:
        return Transition{};
    }
}

Transition SelectionController::handleReveal(const InputEvent& event)
{
    switch (event.key)
    {
    case InputKey::Escape:
    case InputKey::Backspace:
        m_state.mode = Mode::List;
        m_state.revealedUuid.reset();
        return Transition{ Action::ExitReveal, true, true };

    case InputKey::Printable:
        if (event.ch == 'c' || event.ch == 'C')
        {
            return Transition{ Action::CopyCode, false, false };
        }
        return Transition{};

    default:
        return Transition{};
    }
}

bool SelectionController::moveCursor(InputKey key, int total)
{
    if (total <= 0)
    {
        return false;
    }
    const int page{ std::max(1, viewportHeight()) };
    const int current{ std::max(0, m_state.selectedRow) };
    int next{ current };
    switch (key)
    {
    case InputKey::Up:
        next = current - 1;
        break;
    case InputKey::Down:
        next = current + 1;
        break;
    case InputKey::PageUp:
        next = current - page;
        break;
    case InputKey::PageDown:
        next = current + page;
        break;
    case InputKey::Home:
        next = 0;
        break;
    case InputKey::End:
        next = total - 1;
        break;
    default:
        return false;
    }
    m_state.selectedRow = std::clamp(next, 0, total - 1);
    return true;
}

bool SelectionController::revealAllowed() const noexcept
{
    if (m_view.empty())
    {
        return false;
    }
    const bool narrowedToOne{ m_view.size() == 1U && !m_state.searchTerm.empty() };
    return narrowedToOne || m_state.cursorMoved;
}

void SelectionController::applySearch()
{
    m_view = filterEntries(*m_index, m_state.searchTerm, m_state.activeGroup);
    m_state.selectedRow = m_view.jumpRow.value_or(0);
    m_state.cursorMoved = m_view.jumpRow.has_value();
    m_state.scrollOffset = 0;
}

void SelectionController::rebuildGroupChoices()
{
    std::vector<GroupChoice> named{};
    for (const auto& g : m_index->groups())
    {
        if (containsIgnoreCase(g.name, m_state.searchTerm))
        {
            named.push_back(GroupChoice{ g.uuid, g.name });
        }
    }
    std::stable_sort(named.begin(), named.end(), [](const GroupChoice& a, const GroupChoice& b) {
        return toLowerAscii(a.label) < toLowerAscii(b.label);
    });

    m_groupChoices.clear();
    m_groupChoices.reserve(named.size() + 1U);
    m_groupChoices.push_back(GroupChoice{ std::nullopt, std::string{ g_kAllGroupsLabel } });
    m_groupChoices.insert(m_groupChoices.end(), named.begin(), named.end());
    m_state.scrollOffset = 0;
}

void SelectionController::returnToList()
{
    m_state.mode = Mode::List;
    m_state.searchTerm.clear();
    m_state.revealedUuid.reset();
    applySearch();
}

void SelectionController::settle() noexcept
{
    const int total{ m_state.mode == Mode::GroupSelect ? static_cast<int>(m_groupChoices.size())
                                                       : static_cast<int>(m_view.size()) };
    if (total == 0)
    {
        m_state.selectedRow = -1;
        m_state.scrollOffset = 0;
        if (m_state.mode != Mode::GroupSelect)
        {
            m_state.cursorMoved = false;
        }
        return;
    }
    m_state.selectedRow = std::clamp(m_state.selectedRow, 0, total - 1);
    m_state.scrollOffset = clampScroll(m_state.scrollOffset, m_state.selectedRow, viewportHeight(), total);
}

} // namespace otpdeck::core
