#include "SampleIndex.hpp"
#include "otpdeck/core/SelectionController.hpp"
#include <algorithm>
#include <array>
#include <gtest/gtest.h>
#include <random>
#include <sstream>
#include <string>

using otpdeck::core::Action;
using otpdeck::core::InputKey;
using otpdeck::core::keyEvent;
using otpdeck::core::Mode;
using otpdeck::core::printableEvent;
using otpdeck::core::SelectionController;
using otpdeck::core::Transition;

namespace
{

class SelectionControllerTest : public ::testing::Test
{
protected:
    Transition press(InputKey key)
    {
        return controller.handle(keyEvent(key));
    }

    Transition type(std::string_view text)
    {
        Transition last{};
        for (const char c : text)
        {
            last = controller.handle(printableEvent(c));
        }
        return last;
    }

    otpdeck::core::EntryIndex index{ otpdeck::test_utils::sampleIndex() };
    SelectionController controller{ index };
};

} // namespace

TEST_F(SelectionControllerTest, StartsInListWithFirstRowSelected)
{
    EXPECT_EQ(controller.state().mode, Mode::List);
    EXPECT_EQ(controller.state().selectedRow, 0);
    EXPECT_EQ(controller.view().size(), 4U);
    EXPECT_FALSE(controller.state().cursorMoved);
}

TEST_F(SelectionControllerTest, EnterWithoutNarrowingOrMovingDoesNothing)
{
    const auto t{ press(InputKey::Enter) };

    EXPECT_EQ(t.action, Action::None);
    EXPECT_FALSE(t.dirty);
    EXPECT_EQ(controller.state().mode, Mode::List);
    EXPECT_FALSE(controller.state().revealedUuid.has_value());
}

TEST_F(SelectionControllerTest, UniqueSearchRevealsAndEscapeRestoresList)
{
    type("google");
    ASSERT_EQ(controller.view().size(), 1U);

    const auto reveal{ press(InputKey::Enter) };
    EXPECT_EQ(reveal.action, Action::EnterReveal);
    EXPECT_TRUE(reveal.fullRedraw);
    EXPECT_EQ(controller.state().mode, Mode::Reveal);
    ASSERT_NE(controller.revealedEntry(), nullptr);
    EXPECT_EQ(controller.revealedEntry()->uuid, "u-google");

    const auto back{ press(InputKey::Escape) };
    EXPECT_EQ(back.action, Action::ExitReveal);
    EXPECT_TRUE(back.fullRedraw);
    EXPECT_EQ(controller.state().mode, Mode::List);
    EXPECT_EQ(controller.state().searchTerm, "google");
    EXPECT_EQ(controller.view().size(), 1U);
    EXPECT_EQ(controller.revealedEntry(), nullptr);
}

TEST_F(SelectionControllerTest, BackspaceAlsoLeavesReveal)
{
    type("aws");
    ASSERT_EQ(press(InputKey::Enter).action, Action::EnterReveal);

    EXPECT_EQ(press(InputKey::Backspace).action, Action::ExitReveal);
    EXPECT_EQ(controller.state().searchTerm, "aws");
}

TEST_F(SelectionControllerTest, MovingTheCursorArmsEnter)
{
    EXPECT_EQ(press(InputKey::Down).dirty, true);
    EXPECT_TRUE(controller.state().cursorMoved);

    EXPECT_EQ(press(InputKey::Enter).action, Action::EnterReveal);
    EXPECT_EQ(controller.revealedEntry()->uuid, "u-proton");
}

TEST_F(SelectionControllerTest, TypingDisarmsCursorTrigger)
{
    ASSERT_TRUE(press(InputKey::Down).dirty);
    type("alice");

    EXPECT_FALSE(controller.state().cursorMoved);
    EXPECT_EQ(controller.state().selectedRow, 0);
    EXPECT_EQ(press(InputKey::Enter).action, Action::None);
}

TEST_F(SelectionControllerTest, NumericJumpSelectsRowAndArmsEnter)
{
    type("3");

    EXPECT_EQ(controller.view().size(), 4U);
    EXPECT_EQ(controller.state().selectedRow, 2);
    EXPECT_EQ(press(InputKey::Enter).action, Action::EnterReveal);
    EXPECT_EQ(controller.revealedEntry()->uuid, "u-google");
}

TEST_F(SelectionControllerTest, BackspaceBackToNumberJumpsAgain)
{
    type("2x");
    EXPECT_TRUE(controller.view().empty());
    EXPECT_EQ(controller.state().selectedRow, -1);

    const auto t{ press(InputKey::Backspace) };
    EXPECT_TRUE(t.dirty);
    EXPECT_EQ(controller.state().searchTerm, "2");
    EXPECT_EQ(controller.state().selectedRow, 1);
    EXPECT_TRUE(controller.state().cursorMoved);
}

TEST_F(SelectionControllerTest, BackspaceOnEmptyTermIsClean)
{
    const auto t{ press(InputKey::Backspace) };
    EXPECT_EQ(t.action, Action::None);
    EXPECT_FALSE(t.dirty);
}

TEST_F(SelectionControllerTest, EmptyResultIgnoresNavigationAndEnter)
{
    type("zzz");

    EXPECT_FALSE(press(InputKey::Down).dirty);
    EXPECT_EQ(press(InputKey::Enter).action, Action::None);
    EXPECT_EQ(controller.selectedEntry(), nullptr);
    EXPECT_EQ(controller.state().selectedRow, -1);
}

TEST_F(SelectionControllerTest, EscapeInListClearsSearchAndGroup)
{
    ASSERT_EQ(press(InputKey::GroupSelect).fullRedraw, true);
    ASSERT_TRUE(press(InputKey::End).dirty);
    ASSERT_TRUE(press(InputKey::Enter).dirty);
    type("git");
    ASSERT_TRUE(controller.state().activeGroup.has_value());

    const auto t{ press(InputKey::Escape) };
    EXPECT_TRUE(t.dirty);
    EXPECT_TRUE(controller.state().searchTerm.empty());
    EXPECT_FALSE(controller.state().activeGroup.has_value());
    EXPECT_EQ(controller.view().size(), 4U);
}

TEST_F(SelectionControllerTest, GroupChoicesStartWithAllThenSortByName)
{
    type("git");
    press(InputKey::GroupSelect);

    EXPECT_EQ(controller.state().mode, Mode::GroupSelect);
    EXPECT_TRUE(controller.state().searchTerm.empty());
    const auto& choices{ controller.groupChoices() };
    ASSERT_EQ(choices.size(), 3U);
    EXPECT_FALSE(choices[0].uuid.has_value());
    EXPECT_EQ(choices[0].label, otpdeck::core::g_kAllGroupsLabel);
    EXPECT_EQ(choices[1].label, "Personal");
    EXPECT_EQ(choices[2].label, "Work");
}

TEST_F(SelectionControllerTest, ChoosingAGroupRestrictsTheList)
{
    press(InputKey::GroupSelect);
    press(InputKey::Down);
    press(InputKey::Down);

    const auto t{ press(InputKey::Enter) };
    EXPECT_TRUE(t.fullRedraw);
    EXPECT_EQ(controller.state().mode, Mode::List);
    EXPECT_EQ(controller.state().activeGroup, std::optional<std::string>{ "g-work" });
    EXPECT_EQ(controller.activeGroupName(), "Work");
    ASSERT_EQ(controller.view().size(), 2U);
    EXPECT_EQ(controller.view().rows[1].entry->uuid, "u-aws");
    EXPECT_EQ(controller.view().rows[1].rowNumber, 2U);
}

TEST_F(SelectionControllerTest, ChoosingAllOtpsClearsGroup)
{
    otpdeck::core::SelectionController scoped{ index, std::optional<std::string>{ "g-personal" } };
    ASSERT_EQ(scoped.view().size(), 2U);

    ASSERT_TRUE(scoped.handle(keyEvent(InputKey::GroupSelect)).dirty);
    const auto t{ scoped.handle(keyEvent(InputKey::Enter)) };

    EXPECT_TRUE(t.fullRedraw);
    EXPECT_EQ(scoped.state().mode, Mode::List);
    EXPECT_FALSE(scoped.state().activeGroup.has_value());
    EXPECT_EQ(scoped.view().size(), 4U);
}

TEST_F(SelectionControllerTest, TypingInGroupSelectFiltersGroupNames)
{
    press(InputKey::GroupSelect);
    type("WOR");

    const auto& choices{ controller.groupChoices() };
    ASSERT_EQ(choices.size(), 2U);
    EXPECT_EQ(choices[1].label, "Work");

    press(InputKey::Backspace);
    press(InputKey::Backspace);
    press(InputKey::Backspace);
    EXPECT_EQ(controller.groupChoices().size(), 3U);
}

TEST_F(SelectionControllerTest, CancellingGroupSelectShowsEverything)
{
    SelectionController scoped{ index, std::optional<std::string>{ "g-work" } };
    ASSERT_TRUE(scoped.handle(keyEvent(InputKey::GroupSelect)).dirty);

    const auto t{ scoped.handle(keyEvent(InputKey::Escape)) };

    EXPECT_TRUE(t.fullRedraw);
    EXPECT_EQ(scoped.state().mode, Mode::List);
    EXPECT_FALSE(scoped.state().activeGroup.has_value());
    EXPECT_EQ(scoped.view().size(), 4U);
}

TEST_F(SelectionControllerTest, InterruptQuitsFromEveryMode)
{
    EXPECT_EQ(press(InputKey::Interrupt).action, Action::Quit);

    press(InputKey::GroupSelect);
    EXPECT_EQ(press(InputKey::Interrupt).action, Action::Quit);
    press(InputKey::Escape);

    type("google");
    press(InputKey::Enter);
    ASSERT_EQ(controller.state().mode, Mode::Reveal);
    EXPECT_EQ(press(InputKey::Interrupt).action, Action::Quit);
}

TEST_F(SelectionControllerTest, ResizeAsksForFullRedrawInAnyMode)
{
    const auto list{ press(InputKey::Resize) };
    EXPECT_TRUE(list.dirty);
    EXPECT_TRUE(list.fullRedraw);

    type("google");
    press(InputKey::Enter);
    const auto reveal{ press(InputKey::Resize) };
    EXPECT_TRUE(reveal.fullRedraw);
    EXPECT_EQ(controller.state().mode, Mode::Reveal);
}

TEST_F(SelectionControllerTest, RevealKeysOtherThanBackAreInert)
{
    type("google");
    press(InputKey::Enter);

    EXPECT_EQ(controller.handle(printableEvent('c')).action, Action::CopyCode);
    EXPECT_EQ(controller.handle(printableEvent('C')).action, Action::CopyCode);
    EXPECT_EQ(controller.handle(printableEvent('x')).action, Action::None);
    EXPECT_EQ(press(InputKey::Down).action, Action::None);
    EXPECT_EQ(press(InputKey::Enter).action, Action::None);
    EXPECT_EQ(controller.state().searchTerm, "google");
    EXPECT_EQ(controller.state().mode, Mode::Reveal);
}

TEST_F(SelectionControllerTest, RevealByUuidIgnoresFilter)
{
    type("git");

    EXPECT_EQ(controller.revealUuid("nope").action, Action::None);
    EXPECT_EQ(controller.state().mode, Mode::List);

    const auto t{ controller.revealUuid("u-aws") };
    EXPECT_EQ(t.action, Action::EnterReveal);
    EXPECT_EQ(controller.revealedEntry()->issuer, "AWS");
}

TEST(SelectionControllerScroll, NavigationKeepsSelectionVisible)
{
    const auto index{ otpdeck::test_utils::bulkIndex(50) };
    SelectionController controller{ index };
    controller.setTerminalRows(24);
    const int height{ controller.viewportHeight() };
    ASSERT_EQ(height, 17);

    ASSERT_TRUE(controller.handle(keyEvent(InputKey::End)).dirty);
    EXPECT_EQ(controller.state().selectedRow, 49);
    EXPECT_EQ(controller.state().scrollOffset, 50 - height);

    ASSERT_TRUE(controller.handle(keyEvent(InputKey::Home)).dirty);
    EXPECT_EQ(controller.state().selectedRow, 0);
    EXPECT_EQ(controller.state().scrollOffset, 0);

    ASSERT_TRUE(controller.handle(keyEvent(InputKey::PageDown)).dirty);
    EXPECT_EQ(controller.state().selectedRow, height);
    EXPECT_EQ(controller.state().scrollOffset, 1);

    ASSERT_TRUE(controller.handle(keyEvent(InputKey::Up)).dirty);
    ASSERT_TRUE(controller.handle(keyEvent(InputKey::PageUp)).dirty);
    EXPECT_EQ(controller.state().selectedRow, 0);
    EXPECT_EQ(controller.state().scrollOffset, 0);
}

TEST(SelectionControllerScroll, UpAtTopClampsInsteadOfWrapping)
{
    const auto index{ otpdeck::test_utils::bulkIndex(5) };
    SelectionController controller{ index };

    EXPECT_EQ(controller.handle(keyEvent(InputKey::Up)).action, Action::None);
    EXPECT_EQ(controller.state().selectedRow, 0);
}

TEST(SelectionControllerScroll, ShrinkingTerminalReclampsScroll)
{
    const auto index{ otpdeck::test_utils::bulkIndex(50) };
    SelectionController controller{ index };
    controller.setTerminalRows(40);
    ASSERT_TRUE(controller.handle(printableEvent('3')).dirty);
    ASSERT_TRUE(controller.handle(printableEvent('0')).dirty);
    ASSERT_EQ(controller.state().selectedRow, 29);
    const int before{ controller.state().scrollOffset };

    controller.setTerminalRows(12);

    const int height{ controller.viewportHeight() };
    EXPECT_EQ(height, 5);
    EXPECT_GE(controller.state().selectedRow, controller.state().scrollOffset);
    EXPECT_LT(controller.state().selectedRow, controller.state().scrollOffset + height);
    EXPECT_GT(controller.state().scrollOffset, before);
}

TEST(SelectionControllerScroll, JumpScrollsToTarget)
{
    const auto index{ otpdeck::test_utils::bulkIndex(50) };
    SelectionController controller{ index };
    controller.setTerminalRows(24);

    ASSERT_TRUE(controller.handle(printableEvent('4')).dirty);
    ASSERT_TRUE(controller.handle(printableEvent('5')).dirty);

    EXPECT_EQ(controller.state().selectedRow, 44);
    EXPECT_EQ(controller.state().scrollOffset, 44 - controller.viewportHeight() + 1);
}

namespace
{

// Empty when the controller state is consistent, otherwise a description of what is off.
[[nodiscard]] std::string stateViolation(const SelectionController& controller)
{
    const auto& state{ controller.state() };
    const int total{ static_cast<int>(state.mode == Mode::GroupSelect ? controller.groupChoices().size()
                                                                      : controller.view().size()) };
    const int height{ controller.viewportHeight() };
    std::ostringstream out{};

    if (height < 1)
    {
        out << "viewport height " << height;
    }
    else if (total == 0 && (state.selectedRow != -1 || state.scrollOffset != 0))
    {
        out << "empty view with row " << state.selectedRow << " offset " << state.scrollOffset;
    }
    else if (total > 0 && (state.selectedRow < 0 || state.selectedRow >= total))
    {
        out << "row " << state.selectedRow << " outside " << total << " rows";
    }
    else if (state.scrollOffset < 0 || state.scrollOffset > std::max(0, total - height))
    {
        out << "offset " << state.scrollOffset << " for " << total << " rows, height " << height;
    }
    else if (total > 0 && (state.selectedRow < state.scrollOffset || state.selectedRow >= state.scrollOffset + height))
    {
        out << "row " << state.selectedRow << " hidden at offset " << state.scrollOffset << ", height " << height;
    }
    else if (state.mode == Mode::Reveal && controller.revealedEntry() == nullptr)
    {
        out << "reveal without an entry";
    }
    else if (state.mode == Mode::GroupSelect && controller.groupChoices().front().uuid.has_value())
    {
        out << "group list does not start with All OTPs";
    }
    else
    {
        for (std::size_t i{ 0 }; i < controller.view().size(); ++i)
        {
            if (controller.view().rows[i].rowNumber != i + 1U)
            {
                out << "row number " << controller.view().rows[i].rowNumber << " at position " << i;
                break;
            }
        }
    }
    return out.str();
}

} // namespace

TEST(SelectionControllerInvariants, RandomInputKeepsStateConsistent)
{
    const auto index{ otpdeck::test_utils::mixedIndex(40) };
    // Printable is weighted so that searches actually build up.
    const std::array<InputKey, 15> keys{
        InputKey::Up, InputKey::Down, InputKey::PageUp, InputKey::PageDown, InputKey::Home,
        InputKey::End, InputKey::Enter, InputKey::Escape, InputKey::GroupSelect, InputKey::Backspace,
        InputKey::Resize, InputKey::None, InputKey::Printable, InputKey::Printable, InputKey::Printable,
    };
    constexpr std::string_view kTyped{ "0123456789serviceworkpersonalc" };
    std::mt19937 rng{ 20241019U };
    std::uniform_int_distribution<std::size_t> pickKey{ 0, keys.size() - 1 };
    std::uniform_int_distribution<std::size_t> pickChar{ 0, kTyped.size() - 1 };
    std::uniform_int_distribution<int> pickRows{ 3, 60 };

    for (int run{ 0 }; run < 50; ++run)
    {
        SelectionController controller{ index };
        controller.setTerminalRows(24);
        for (int step{ 0 }; step < 300; ++step)
        {
            const InputKey key{ keys[pickKey(rng)] };
            if (key == InputKey::Printable)
            {
                static_cast<void>(controller.handle(printableEvent(kTyped[pickChar(rng)])));
            }
            else
            {
                if (key == InputKey::Resize)
                {
                    controller.setTerminalRows(pickRows(rng));
                }
                static_cast<void>(controller.handle(keyEvent(key)));
            }

            const auto violation{ stateViolation(controller) };
            if (!violation.empty())
            {
                FAIL() << "run " << run << " step " << step << ": " << violation;
            }
        }
    }
}
