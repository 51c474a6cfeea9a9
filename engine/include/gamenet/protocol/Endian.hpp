#pragma once

#include <cstddef> // std::byte
#include <cstdint>

namespace gamenet::protocol
{
// 헤더/제어 메시지 필드는 big-endian, AEAD nonce 안의 sequence 만 little-endian 이다.

inline void storeU16Be(std::uint16_t v, std::byte *out) noexcept
{
    out[0] = static_cast<std::byte>((v >> 8) & 0xFF);
    out[1] = static_cast<std::byte>((v >> 0) & 0xFF);
}

inline void storeU64Be(std::uint64_t v, std::byte *out) noexcept
{
    for (int i = 0; i < 8; ++i)
    {
        out[i] = static_cast<std::byte>((v >> (56 - 8 * i)) & 0xFF);
    }
}

inline void storeU64Le(std::uint64_t v, std::byte *out) noexcept
{
    for (int i = 0; i < 8; ++i)
    {
        out[i] = static_cast<std::byte>((v >> (8 * i)) & 0xFF);
    }
}

inline std::uint16_t loadU16Be(const std::byte *p) noexcept
{
    return static_cast<std::uint16_t>((std::to_integer<std::uint16_t>(p[0]) << 8) |
                                      (std::to_integer<std::uint16_t>(p[1]) << 0));
}

inline std::uint64_t loadU64Be(const std::byte *p) noexcept
{
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
    {
        v = (v << 8) | std::to_integer<std::uint64_t>(p[i]);
    }
    return v;
}
} // namespace gamenet::protocol
