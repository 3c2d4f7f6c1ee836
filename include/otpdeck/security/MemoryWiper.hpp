#ifndef INCLUDE_OTPDECK_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_OTPDECK_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace otpdeck::security
{

// Zeroes memory in a way the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> values) noexcept
{
    secureWipe(std::as_writable_bytes(values));
}

// Wipes a NUL-terminated string in place, terminator excluded. Used for
// secrets handed over through the process environment. Returns the length wiped.
std::size_t secureWipeCString(char* text) noexcept;

} // namespace otpdeck::security

#endif // INCLUDE_OTPDECK_SECURITY_MEMORYWIPER_HPP
