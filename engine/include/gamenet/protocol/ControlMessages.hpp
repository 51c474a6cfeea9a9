#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <gamenet/crypto/Key.hpp>
#include <gamenet/protocol/MessageCodec.hpp>

namespace gamenet::protocol
{

/// 연결이 끊긴 이유. Disconnect 프레임 body 에 u8 로 실린다.
enum class DisconnectReason : std::uint8_t
{
    Requested = 0,         ///< 애플리케이션이 disconnect() 호출
    IoFailure = 1,         ///< 소켓 오류 / EOF
    Corruption = 2,        ///< 헤더 위반 또는 인증 실패
    Replay = 3,            ///< sequence 가 앞으로 가지 않음
    HandshakeTimeout = 4,
    IdleTimeout = 5,
    InvalidToken = 6,
    ProtocolViolation = 7, ///< 상태에 맞지 않는 제어 프레임
    PeerDisconnect = 8,    ///< 상대가 Disconnect 를 보냄
    Shutdown = 9,
};

inline constexpr std::uint8_t kMaxDisconnectReason = static_cast<std::uint8_t>(DisconnectReason::Shutdown);

[[nodiscard]] std::string_view toString(DisconnectReason reason) noexcept;

/// 토큰 안의 비공개 데이터. 인증 서버와 게임 서버만 읽을 수 있다.
struct PrivateData
{
    static constexpr std::size_t kSize = 8 + crypto::kKeySize * 2;

    std::uint64_t clientId{0};
    crypto::Key serverKey{}; ///< client -> server 방향 키
    crypto::Key clientKey{}; ///< server -> client 방향 키
};

/// 연결 토큰 평문. 헤더 sequence 가 challenge 역할을 하며 challengeSequence 와 같아야 한다.
///
/// protocolId:u16 | version:u16 | expire:u64 | challengeSequence:u64 | PrivateData
struct ConnectToken
{
    static constexpr std::size_t kBodySize = 2 + 2 + 8 + 8 + PrivateData::kSize;

    std::uint16_t protocolId{0};
    std::uint16_t version{0};
    std::uint64_t expireUnixSec{0};
    std::uint64_t challengeSequence{0};
    PrivateData data{};

    [[nodiscard]] bool encode(SpanWriter &w) const noexcept;

    /// body 길이가 정확히 kBodySize 가 아니면 false.
    [[nodiscard]] static bool decode(std::span<const std::byte> body, ConnectToken &out) noexcept;
};

enum class TokenCheck : std::uint8_t
{
    Ok,
    ProtocolMismatch,
    VersionMismatch,
    Expired,
    ChallengeMismatch,
};

[[nodiscard]] std::string_view toString(TokenCheck check) noexcept;

/// 복호화된 토큰의 필드들을 서버 설정/현재 시각/헤더 sequence 와 대조한다.
[[nodiscard]] TokenCheck checkToken(const ConnectToken &token, std::uint16_t protocolId,
                                    std::uint16_t version, std::uint64_t nowUnixSec,
                                    std::uint64_t headerSequence) noexcept;

/// Accepted body = clientId:u64
inline constexpr std::size_t kAcceptedBodySize = 8;

[[nodiscard]] bool encodeAccepted(SpanWriter &w, std::uint64_t clientId) noexcept;
[[nodiscard]] bool decodeAccepted(std::span<const std::byte> body, std::uint64_t &clientId) noexcept;

/// Disconnect body = reason:u8
inline constexpr std::size_t kDisconnectBodySize = 1;

[[nodiscard]] bool encodeDisconnect(SpanWriter &w, DisconnectReason reason) noexcept;
[[nodiscard]] bool decodeDisconnect(std::span<const std::byte> body, DisconnectReason &reason) noexcept;

} // namespace gamenet::protocol
