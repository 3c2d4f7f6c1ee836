#include "Encoding.hpp"

#include <cstdint>

namespace otpdeck::vault::detail
{

namespace
{

constexpr int g_kInvalid{ -1 };

[[nodiscard]] constexpr int hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return g_kInvalid;
}

[[nodiscard]] constexpr int base64Value(char c) noexcept
{
    if (c >= 'A' && c <= 'Z')
    {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z')
    {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9')
    {
        return c - '0' + 52;
    }
    if (c == '+')
    {
        return 62;
    }
    if (c == '/')
    {
        return 63;
    }
    return g_kInvalid;
}

[[nodiscard]] constexpr int base32Value(char c) noexcept
{
    if (c >= 'A' && c <= 'Z')
    {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z')
    {
        return c - 'a';
    }
    if (c >= '2' && c <= '7')
    {
        return c - '2' + 26;
    }
    return g_kInvalid;
}

[[nodiscard]] std::string_view stripPadding(std::string_view text) noexcept
{
    while (!text.empty() && text.back() == '=')
    {
        text.remove_suffix(1);
    }
    return text;
}

// Accumulates fixed-width symbols into bytes, most significant bit first.
template <unsigned Bits, class Lookup>
[[nodiscard]] std::optional<otpdeck::security::SecureBuffer> decodeBits(std::string_view text, Lookup lookup,
                                                                        bool skipSpaces)
{
    constexpr unsigned kBitsPerByte{ 8U };
    constexpr std::uint32_t kByteMask{ 0xFFU };

    otpdeck::security::SecureBuffer out{};
    out.reserve((text.size() * Bits) / kBitsPerByte);

    std::uint32_t buffer{ 0U };
    unsigned bits{ 0U };
    for (const char c : text)
    {
        if (skipSpaces && c == ' ')
        {
            continue;
        }
        const int v{ lookup(c) };
        if (v == g_kInvalid)
        {
            otpdeck::security::secureRelease(out);
            return std::nullopt;
        }
        buffer = (buffer << Bits) | static_cast<std::uint32_t>(v);
        bits += Bits;
        if (bits >= kBitsPerByte)
        {
            bits -= kBitsPerByte;
            out.push_back(static_cast<std::uint8_t>((buffer >> bits) & kByteMask));
        }
    }
    return out;
}

} // namespace

std::optional<otpdeck::security::SecureBuffer> decodeHex(std::string_view text)
{
    if (text.size() % 2U != 0U)
    {
        return std::nullopt;
    }
    return decodeBits<4U>(text, [](char c) { return hexValue(c); }, false);
}

std::optional<otpdeck::security::SecureBuffer> decodeBase64(std::string_view text)
{
    return decodeBits<6U>(stripPadding(text), [](char c) { return base64Value(c); }, false);
}

std::optional<otpdeck::security::SecureBuffer> decodeBase32(std::string_view text)
{
    return decodeBits<5U>(stripPadding(text), [](char c) { return base32Value(c); }, true);
}

} // namespace otpdeck::vault::detail
