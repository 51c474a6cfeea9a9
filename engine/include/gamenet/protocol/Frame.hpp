#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <gamenet/protocol/Header.hpp>

namespace gamenet::protocol
{

/// 검증과 복호화를 마친 패킷 하나의 평문 view.
///
/// body 는 Channel 읽기 버퍼 안을 가리키며 다음 Channel::read() 호출 전까지만 유효하다.
struct Frame
{
    FrameClass frameClass{FrameClass::Payload};
    std::uint64_t sequence{0};
    std::span<const std::byte> body{};

    [[nodiscard]] bool isControl() const noexcept { return protocol::isControl(frameClass); }
};

} // namespace gamenet::protocol
