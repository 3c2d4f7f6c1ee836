#include "otpdeck/security/MemoryWiper.hpp"

#if defined(__linux__)
#include <string.h>
#else
#error "Unsupported platform"
#endif

namespace otpdeck::security
{

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
    ::explicit_bzero(bytes.data(), bytes.size());
}

std::size_t secureWipeCString(char* text) noexcept
{
    if (text == nullptr)
    {
        return 0;
    }
    const std::size_t length{ ::strlen(text) };
    secureWipe(std::as_writable_bytes(std::span<char>{ text, length }));
    return length;
}

} // namespace otpdeck::security
