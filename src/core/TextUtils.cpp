#include "otpdeck/core/TextUtils.hpp"

#include <algorithm>
#include <cstddef>

namespace otpdeck::core
{

namespace
{

[[nodiscard]] constexpr char foldAscii(char c) noexcept
{
    if (c >= 'A' && c <= 'Z')
    {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

} // namespace

std::string toLowerAscii(std::string_view s)
{
    std::string out{ s };
    std::transform(out.begin(), out.end(), out.begin(), [](char c) { return foldAscii(c); });
    return out;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (std::size_t i{}; i < a.size(); ++i)
    {
        if (foldAscii(a[i]) != foldAscii(b[i]))
        {
            return false;
        }
    }
    return true;
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) noexcept
{
    if (needle.empty())
    {
        return true;
    }
    const auto it{ std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                               [](char l, char r) { return foldAscii(l) == foldAscii(r); }) };
    return it != haystack.end();
}

std::optional<long long> parseDecimal(std::string_view s) noexcept
{
    constexpr std::size_t kMaxDigits{ 12U };
    constexpr long long kBase{ 10 };
    if (s.empty() || s.size() > kMaxDigits)
    {
        return std::nullopt;
    }
    long long value{ 0 };
    for (const char c : s)
    {
        if (c < '0' || c > '9')
        {
            return std::nullopt;
        }
        value = value * kBase + static_cast<long long>(c - '0');
    }
    return value;
}

} // namespace otpdeck::core
