#ifndef INCLUDE_OTPDECK_CORE_TEXTUTILS_HPP
#define INCLUDE_OTPDECK_CORE_TEXTUTILS_HPP

#include <optional>
#include <string>
#include <string_view>

namespace otpdeck::core
{

// ASCII-only folding; non-ASCII bytes are compared as-is.
[[nodiscard]] std::string toLowerAscii(std::string_view s);

[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept;

[[nodiscard]] bool containsIgnoreCase(std::string_view haystack, std::string_view needle) noexcept;

// Parses a non-empty run of ASCII digits. Overlong input yields std::nullopt.
[[nodiscard]] std::optional<long long> parseDecimal(std::string_view s) noexcept;

} // namespace otpdeck::core

#endif // INCLUDE_OTPDECK_CORE_TEXTUTILS_HPP
