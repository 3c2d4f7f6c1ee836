#ifndef INCLUDE_OTPDECK_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_OTPDECK_SECURITY_SCOPEWIPE_HPP

#include "otpdeck/security/MemoryWiper.hpp"
#include "otpdeck/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace otpdeck::security
{

// Wipes a borrowed byte range when the guard leaves scope.
// Used for plain std::string temporaries that briefly hold secrets (env password, JSON text).
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ other.m_bytes }
    {
        other.release();
    }

    ScopeWipe& operator=(ScopeWipe&& other) noexcept
    {
        if (this != &other)
        {
            secureWipe(m_bytes);
            m_bytes = other.m_bytes;
            other.release();
        }
        return *this;
    }

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

    void release() noexcept
    {
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> bytes) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(bytes) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ asWritableBytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(std::string& s) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<char>{ s.data(), s.size() }) };
}

} // namespace otpdeck::security

#endif // INCLUDE_OTPDECK_SECURITY_SCOPEWIPE_HPP
