#ifndef INCLUDE_OTPDECK_CORE_SELECTIONCONTROLLER_HPP
#define INCLUDE_OTPDECK_CORE_SELECTIONCONTROLLER_HPP

#include "otpdeck/core/Entry.hpp"
#include "otpdeck/core/FilterEngine.hpp"
#include "otpdeck/core/InputEvent.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace otpdeck::core
{

enum class Mode : std::uint8_t
{
    List,
    GroupSelect,
    Reveal,
};

enum class Action : std::uint8_t
{
    None,
    EnterReveal,
    ExitReveal,
    CopyCode,
    Quit,
};

struct Transition final
{
    Action action{ Action::None };
    bool dirty{ false };
    bool fullRedraw{ false };
};

struct GroupChoice final
{
    std::optional<std::string> uuid; // std::nullopt is "All OTPs"
    std::string label;
};

inline constexpr std::string_view g_kAllGroupsLabel{ "All OTPs" };

// In GroupSelect mode searchTerm holds the group name filter, and selectedRow and
// scrollOffset index groupChoices().
struct SelectionState final
{
    Mode mode{ Mode::List };
    std::string searchTerm;
    int selectedRow{ -1 };
    std::optional<std::string> activeGroup;
    std::optional<std::string> revealedUuid;
    int scrollOffset{ 0 };
    bool cursorMoved{ false };
};

// List / GroupSelect / Reveal state machine.
// Every input is accepted in every mode; out-of-range moves are clamped, never rejected.
class SelectionController final
{
public:
    explicit SelectionController(const EntryIndex& index, std::optional<std::string> initialGroup = std::nullopt);

    [[nodiscard]] Transition handle(const InputEvent& event);

    // Reveals an entry by uuid regardless of the current filter.
    // Returns Action::None when the uuid is unknown.
    [[nodiscard]] Transition revealUuid(std::string_view uuid);

    // Recomputes both viewport heights from the terminal height and re-clamps the scroll offset.
    void setTerminalRows(int rows) noexcept;

    [[nodiscard]] const SelectionState& state() const noexcept
    {
        return m_state;
    }
    [[nodiscard]] const FilteredView& view() const noexcept
    {
        return m_view;
    }
    [[nodiscard]] const std::vector<GroupChoice>& groupChoices() const noexcept
    {
        return m_groupChoices;
    }
    [[nodiscard]] int viewportHeight() const noexcept;

    [[nodiscard]] const Entry* selectedEntry() const noexcept;
    [[nodiscard]] const Entry* revealedEntry() const noexcept;
    [[nodiscard]] std::string activeGroupName() const;

private:
    [[nodiscard]] Transition handleList(const InputEvent& event);
    [[nodiscard]] Transition handleGroupSelect(const InputEvent& event);
    [[nodiscard]] Transition handleReveal(const InputEvent& event);

    [[nodiscard]] bool moveCursor(InputKey key, int total);
    [[nodiscard]] bool revealAllowed() const noexcept;

    void applySearch();
    void rebuildGroupChoices();
    void returnToList();
    void settle() noexcept;

    const EntryIndex* m_index;
    SelectionState m_state{};
    FilteredView m_view{};
    std::vector<GroupChoice> m_groupChoices{};
    int m_listHeight{ 1 };
    int m_groupHeight{ 1 };
};

} // namespace otpdeck::core

#endif // INCLUDE_OTPDECK_CORE_SELECTIONCONTROLLER_HPP
