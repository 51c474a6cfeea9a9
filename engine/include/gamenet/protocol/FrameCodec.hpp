#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <gamenet/crypto/Aead.hpp>
#include <gamenet/crypto/Key.hpp>
#include <gamenet/protocol/ControlMessages.hpp>
#include <gamenet/protocol/Frame.hpp>
#include <gamenet/protocol/Header.hpp>

namespace gamenet::protocol
{

/// 프레임 = header(11) | ciphertext | tag(16)
///
/// header 11바이트가 그대로 AEAD 의 associated data 가 되므로
/// class/sequence/size 중 어느 비트를 바꿔도 tag 검증이 실패한다.
inline constexpr std::size_t kTagSize = crypto::kTagSize;
inline constexpr std::size_t kMinFrameSize = kHeaderSize + kTagSize;

/// 가장 큰 제어 메시지(토큰) body
inline constexpr std::size_t kMaxControlBodySize = ConnectToken::kBodySize;

[[nodiscard]] constexpr std::size_t frameSizeFor(std::size_t plainLen) noexcept
{
    return kHeaderSize + plainLen + kTagSize;
}

/// frame 안의 평문 자리(header 뒤, tag 앞)
[[nodiscard]] inline std::span<std::byte> plainArea(std::span<std::byte> frame) noexcept
{
    return frame.subspan(kHeaderSize, frame.size() - kMinFrameSize);
}

/// frame[kHeaderSize..] 에 이미 쓰여 있는 평문을 제자리에서 봉인한다.
/// header 를 채우고, 평문을 암호화하고, 끝에 tag 를 붙인다.
[[nodiscard]] bool sealFrame(crypto::Aead &aead, const crypto::Key &key, FrameClass cls,
                             std::uint64_t sequence, std::span<std::byte> frame) noexcept;

/// header 가 기술하는 frame 전체(kHeaderSize + header.size)를 제자리에서 연다.
/// 성공하면 out.body 가 frame 안의 평문을 가리킨다.
[[nodiscard]] bool openFrame(crypto::Aead &aead, const crypto::Key &key, const Header &header,
                             std::span<std::byte> frame, Frame &out) noexcept;

} // namespace gamenet::protocol
