#include "otpdeck/core/InputEvent.hpp"

namespace otpdeck::core
{

namespace
{
constexpr int g_kCtrlC{ 3 };
constexpr int g_kCtrlG{ 7 };
constexpr int g_kCtrlH{ 8 };
constexpr int g_kLineFeed{ 10 };
constexpr int g_kCarriageReturn{ 13 };
constexpr int g_kEscape{ 27 };
constexpr int g_kDelete{ 127 };
constexpr int g_kFirstPrintable{ 32 };
constexpr int g_kLastPrintable{ 126 };
} // namespace

InputEvent decodeByte(int byte) noexcept
{
    switch (byte)
    {
    case g_kCtrlC:
        return keyEvent(InputKey::Interrupt);
    case g_kCtrlG:
        return keyEvent(InputKey::GroupSelect);
    case g_kCtrlH:
    case g_kDelete:
        return keyEvent(InputKey::Backspace);
    case g_kLineFeed:
    case g_kCarriageReturn:
        return keyEvent(InputKey::Enter);
    case g_kEscape:
        return keyEvent(InputKey::Escape);
    default:
        break;
    }
    if (byte >= g_kFirstPrintable && byte <= g_kLastPrintable)
    {
        return printableEvent(static_cast<char>(byte));
    }
    return keyEvent(InputKey::None);
}

} // namespace otpdeck::core
