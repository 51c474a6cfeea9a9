#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace gamenet::protocol
{

/// 패킷 class. Payload 만 게임 데이터이고 나머지는 모두 제어 메시지다.
enum class FrameClass : std::uint8_t
{
    Payload = 0,
    Keepalive = 1,
    Accepted = 2,   ///< server -> client, 핸드셰이크 완료 통지
    Disconnect = 3,
    Token = 4,      ///< client -> server, 첫 프레임
};

inline constexpr std::uint8_t kMaxFrameClass = static_cast<std::uint8_t>(FrameClass::Token);

/// class:u8 | sequence:u64 | size:u16  (big-endian)
inline constexpr std::size_t kHeaderSize = 11;

[[nodiscard]] std::string_view toString(FrameClass cls) noexcept;

[[nodiscard]] constexpr bool isControl(FrameClass cls) noexcept
{
    return cls != FrameClass::Payload;
}

enum class HeaderParse : std::uint8_t
{
    NeedMore, ///< kHeaderSize 미만
    Parsed,
    Invalid,  ///< 알 수 없는 class
};

/// 고정 크기 패킷 preamble. size 는 ciphertext + tag 길이다.
struct Header
{
    FrameClass frameClass{FrameClass::Payload};
    std::uint64_t sequence{0};
    std::uint16_t size{0};

    /// bytes 앞쪽 kHeaderSize 바이트를 해석한다. 할당/복사 없음.
    [[nodiscard]] static HeaderParse parse(std::span<const std::byte> bytes, Header &out) noexcept;

    /// out 은 최소 kHeaderSize 바이트여야 한다.
    void encode(std::span<std::byte> out) const noexcept;

    [[nodiscard]] std::size_t frameSize() const noexcept { return kHeaderSize + size; }
};

} // namespace gamenet::protocol
