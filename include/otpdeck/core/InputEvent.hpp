#ifndef INCLUDE_OTPDECK_CORE_INPUTEVENT_HPP
#define INCLUDE_OTPDECK_CORE_INPUTEVENT_HPP

#include <cstdint>

namespace otpdeck::core
{

enum class InputKey : std::uint8_t
{
    None, // poll timed out
    Printable,
    Backspace,
    Up,
    Down,
    PageUp,
    PageDown,
    Home,
    End,
    Enter,
    Escape,
    GroupSelect, // Ctrl+G
    Resize,
    Interrupt, // Ctrl+C or a termination signal
};

struct InputEvent final
{
    InputKey key{ InputKey::None };
    char ch{ '\0' };
};

[[nodiscard]] constexpr InputEvent keyEvent(InputKey key) noexcept
{
    return InputEvent{ key, '\0' };
}

[[nodiscard]] constexpr InputEvent printableEvent(char ch) noexcept
{
    return InputEvent{ InputKey::Printable, ch };
}

// Classifies a single raw byte as delivered by a terminal in raw mode.
// Bytes with no meaning for the browser map to InputKey::None.
[[nodiscard]] InputEvent decodeByte(int byte) noexcept;

} // namespace otpdeck::core

#endif // INCLUDE_OTPDECK_CORE_INPUTEVENT_HPP
