#ifndef INCLUDE_OTPDECK_CORE_VIEWPORT_HPP
#define INCLUDE_OTPDECK_CORE_VIEWPORT_HPP

namespace otpdeck::core
{

// Screen rows taken by everything except the entry rows.
inline constexpr int g_kListChromeRows{ 7 };
inline constexpr int g_kGroupChromeRows{ 5 };

inline constexpr int g_kMinTerminalRows{ 12 };
inline constexpr int g_kMinTerminalCols{ 40 };

// Smallest scroll offset change that keeps selectedRow visible, clamped to
// [0, max(0, totalRows - height)]. A height below 1 counts as 1.
[[nodiscard]] int clampScroll(int scrollOffset, int selectedRow, int viewportHeight, int totalRows) noexcept;

[[nodiscard]] int listViewportHeight(int terminalRows) noexcept;
[[nodiscard]] int groupViewportHeight(int terminalRows) noexcept;

[[nodiscard]] bool terminalTooSmall(int rows, int cols) noexcept;

} // namespace otpdeck::core

#endif // INCLUDE_OTPDECK_CORE_VIEWPORT_HPP
