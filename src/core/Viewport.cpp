#include "otpdeck/core/Viewport.hpp"

#include <algorithm>

namespace otpdeck::core
{

int clampScroll(int scrollOffset, int selectedRow, int viewportHeight, int totalRows) noexcept
{
    const int height{ std::max(1, viewportHeight) };
    if (totalRows <= 0 || selectedRow < 0)
    {
        return 0;
    }

    const int selected{ std::min(selectedRow, totalRows - 1) };
    int scroll{ scrollOffset };
    if (selected < scroll)
    {
        scroll = selected;
    }
    else if (selected >= scroll + height)
    {
        scroll = selected - height + 1;
    }

    const int maxScroll{ std::max(0, totalRows - height) };
    return std::clamp(scroll, 0, maxScroll);
}

int listViewportHeight(int terminalRows) noexcept
{
    return std::max(1, terminalRows - g_kListChromeRows);
}

int groupViewportHeight(int terminalRows) noexcept
{
    return std::max(1, terminalRows - g_kGroupChromeRows);
}

bool terminalTooSmall(int rows, int cols) noexcept
{
    return rows < g_kMinTerminalRows || cols < g_kMinTerminalCols;
}

} // namespace otpdeck::core
