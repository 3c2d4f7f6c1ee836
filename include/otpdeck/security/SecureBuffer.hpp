#ifndef INCLUDE_OTPDECK_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_OTPDECK_SECURITY_SECUREBUFFER_HPP

#include "otpdeck/security/MemoryWiper.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace otpdeck::security
{

// Allocator that wipes every block before handing it back to the heap.
// Reallocation inside std::vector therefore never leaves key material behind.
template <class T> struct WipingAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    WipingAllocator() noexcept = default;

    template <class U> constexpr explicit WipingAllocator([[maybe_unused]] const WipingAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(p), n * sizeof(T) });
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const WipingAllocator<T>& lhs,
                          [[maybe_unused]] const WipingAllocator<U>& rhs) noexcept
{
    return true;
}

// Raw key material: slot keys, master key, decoded OTP secrets.
using SecureBuffer = std::vector<std::uint8_t, WipingAllocator<std::uint8_t>>;

// Passwords and decrypted plaintext that is parsed as text.
using SecureString = std::vector<char, WipingAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::string_view asStringView(const SecureBuffer& b) noexcept
{
    if (b.empty())
    {
        return {};
    }
    return std::string_view{ reinterpret_cast<const char*>(b.data()), b.size() };
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

// Wipes the contents and gives the capacity back.
template <class Container> inline void secureRelease(Container& c) noexcept
{
    secureWipe(asWritableBytes(c));
    Container empty{};
    c.swap(empty);
}

} // namespace otpdeck::security

#endif // INCLUDE_OTPDECK_SECURITY_SECUREBUFFER_HPP
