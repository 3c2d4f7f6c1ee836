#ifndef OTPDECK_TESTS_TEST_UTILS_FAKETERMINAL_HPP
#define OTPDECK_TESTS_TEST_UTILS_FAKETERMINAL_HPP

#include "ITerminal.hpp"
#include <algorithm>
#include <deque>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace otpdeck::test_utils
{

struct DrawCall final
{
    int row{ 0 };
    int col{ 0 };
    std::string text;
    otpdeck::ui::tui::TextStyle style{ otpdeck::ui::tui::TextStyle::Normal };
};

// In-memory screen with a scripted keyboard. When the script runs out, readInput() reports Interrupt.
class FakeTerminal final : public otpdeck::ui::tui::ITerminal
{
public:
    explicit FakeTerminal(int rows = 24, int cols = 80)
    {
        resize(rows, cols);
    }

    void resize(int rows, int cols)
    {
        m_size = otpdeck::ui::tui::TerminalSize{ rows, cols };
        m_screen.assign(static_cast<std::size_t>(std::max(0, rows)),
                        std::string(static_cast<std::size_t>(std::max(0, cols)), ' '));
    }

    void script(std::initializer_list<otpdeck::core::InputEvent> events)
    {
        m_input.insert(m_input.end(), events.begin(), events.end());
    }
    void push(otpdeck::core::InputEvent event)
    {
        m_input.push_back(event);
    }

    // Runs before each readInput(); tests use it to advance a fake clock.
    void onRead(std::function<void()> hook)
    {
        m_onRead = std::move(hook);
    }

    [[nodiscard]] otpdeck::ui::tui::TerminalSize size() const override
    {
        return m_size;
    }

    void clear() override
    {
        ++clearCount;
        resize(m_size.rows, m_size.cols);
    }

    void clearLine(int row, int col) override
    {
        if (row < 0 || row >= m_size.rows || col < 0 || col >= m_size.cols)
        {
            return;
        }
        auto& line{ m_screen[static_cast<std::size_t>(row)] };
        std::fill(line.begin() + col, line.end(), ' ');
    }

    void drawText(int row, int col, std::string_view text, otpdeck::ui::tui::TextStyle style) override
    {
        draws.push_back(DrawCall{ row, col, std::string{ text }, style });
        if (row < 0 || row >= m_size.rows || col < 0 || col >= m_size.cols)
        {
            return;
        }
        auto& line{ m_screen[static_cast<std::size_t>(row)] };
        const auto n{ std::min(text.size(), line.size() - static_cast<std::size_t>(col)) };
        line.replace(static_cast<std::size_t>(col), n, text.substr(0, n));
    }

    void drawBox(int /*top*/, int /*left*/, int /*height*/, int /*width*/) override
    {
        ++boxCount;
    }

    void present() override
    {
        ++presentCount;
    }

    void setInputTimeout(int ms) override
    {
        m_timeoutMs = ms;
        timeouts.push_back(ms);
    }
    [[nodiscard]] int inputTimeout() const noexcept override
    {
        return m_timeoutMs;
    }

    [[nodiscard]] otpdeck::core::InputEvent readInput() override
    {
        ++readCount;
        if (m_onRead)
        {
            m_onRead();
        }
        if (m_input.empty())
        {
            return otpdeck::core::keyEvent(otpdeck::core::InputKey::Interrupt);
        }
        const auto ev{ m_input.front() };
        m_input.pop_front();
        return ev;
    }

    void flushInput() override
    {
        ++flushCount;
    }

    [[nodiscard]] const std::string& line(int row) const
    {
        return m_screen.at(static_cast<std::size_t>(row));
    }

    [[nodiscard]] bool screenContains(std::string_view needle) const
    {
        return std::any_of(m_screen.begin(), m_screen.end(),
                           [needle](const std::string& l) { return l.find(needle) != std::string::npos; });
    }

    void resetCounters()
    {
        draws.clear();
        clearCount = 0;
        presentCount = 0;
        boxCount = 0;
    }

    std::vector<DrawCall> draws;
    std::vector<int> timeouts;
    int clearCount{ 0 };
    int presentCount{ 0 };
    int boxCount{ 0 };
    int readCount{ 0 };
    int flushCount{ 0 };

private:
    otpdeck::ui::tui::TerminalSize m_size{};
    std::vector<std::string> m_screen;
    std::deque<otpdeck::core::InputEvent> m_input;
    std::function<void()> m_onRead;
    int m_timeoutMs{ -1 };
};

} // namespace otpdeck::test_utils

#endif // OTPDECK_TESTS_TEST_UTILS_FAKETERMINAL_HPP
