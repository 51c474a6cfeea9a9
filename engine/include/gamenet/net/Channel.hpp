#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <gamenet/EndpointConfig.hpp>
#include <gamenet/buffer/Buffer.hpp>
#include <gamenet/buffer/ChunkPool.hpp>
#include <gamenet/crypto/Aead.hpp>
#include <gamenet/crypto/Key.hpp>
#include <gamenet/net/ConnectionChange.hpp>
#include <gamenet/net/Socket.hpp>
#include <gamenet/protocol/ControlMessages.hpp>
#include <gamenet/protocol/Frame.hpp>
#include <gamenet/protocol/PayloadBatch.hpp>
#include <gamenet/protocol/ReplayGuard.hpp>
#include <gamenet/util/NonCopyable.hpp>

namespace gamenet::net
{

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// 핸드셰이크 단계. Disconnected 는 전이 결과로만 쓰이고 채널에 저장되지 않는다.
enum class ChannelState : std::uint8_t
{
    AwaitingToken,
    Connected,
    Disconnected,
};

[[nodiscard]] std::string_view toString(ChannelState state) noexcept;

enum class ReadStatus : std::uint8_t
{
    NeedMore, ///< 온전한 프레임이 아직 없음. 상태 변화 없음
    Framed,   ///< out 에 프레임 하나
    Fatal,    ///< failure() 사유로 끊어야 함
};

enum class WriteStatus : std::uint8_t
{
    Written,
    Wait,  ///< 송신 버퍼 한도. 나중에 다시 시도
    Fatal, ///< failure() 사유로 끊어야 함
};

struct Transition
{
    ChannelState next{ChannelState::AwaitingToken};
    protocol::DisconnectReason reason{protocol::DisconnectReason::Requested}; ///< next == Disconnected 일 때만 의미
};

/// 연결 하나의 프레이밍/암호화/anti-replay/핸드셰이크 상태입니다.
///
/// ===== 소유 =====
/// - 소켓과 읽기/쓰기 Buffer 는 채널 소유. 채널이 파괴되면 청크는 풀로 돌아가고 소켓은 닫힌다.
/// - ChunkPool, Aead, SecretKey, 설정은 Endpoint 가 빌려준다(채널보다 오래 산다).
///
/// ===== 키 =====
/// - AwaitingToken: 수신은 SecretKey 로 연다. 송신하지 않는다.
/// - Connected: 토큰의 serverKey 로 수신, clientKey 로 송신.
///
/// 모든 오류는 상태 enum 으로 돌려주고, 끊는 것은 Endpoint 몫이다.
class Channel : private gamenet::util::NonMovable
{
  public:
    Channel(ChannelId id, Socket socket, buffer::ChunkPool &pool, crypto::Aead &aead,
            const crypto::SecretKey &secret, const EndpointConfig &config, TimePoint now);

    /// 소켓에서 읽을 수 있는 만큼(최대 maxIngressBytes 까지) 읽기 버퍼로 가져온다.
    /// Failed 면 failure() == IoFailure.
    /// EOF 는 실패가 아니다. peerClosed() 가 켜지고, 이미 받은 프레임은 read() 로 꺼낼 수 있다.
    [[nodiscard]] buffer::IoStatus receive(TimePoint now);

    /// 읽기 버퍼 맨 앞의 프레임 하나를 검증/복호화한다.
    ///
    /// 순서: 헤더 해석 -> size 범위 -> 도착 여부 -> 인증 복호화 -> sequence 검사.
    /// out.body 는 다음 read() 호출 전까지만 유효하다.
    [[nodiscard]] ReadStatus read(protocol::Frame &out) noexcept;

    /// 방금 읽은 프레임으로 핸드셰이크 상태를 진행한다.
    /// 토큰이 유효하면 키를 설치하고 Connected 가 된다.
    [[nodiscard]] Transition advance(const protocol::Frame &frame, std::uint64_t nowUnixSec) noexcept;

    /// batch 앞에서부터 프레임에 담을 수 있는 만큼 담아 보내고, 담은 메시지는 batch 에서 뺀다.
    /// 한 프레임에 들어가지 않는 메시지는 버린다(WARN).
    [[nodiscard]] WriteStatus writePayload(protocol::PayloadBatch &batch, TimePoint now);

    [[nodiscard]] WriteStatus sendKeepalive(TimePoint now);
    [[nodiscard]] WriteStatus sendAccepted(TimePoint now);
    [[nodiscard]] WriteStatus sendDisconnect(protocol::DisconnectReason reason, TimePoint now);

    /// 쓰기 버퍼를 소켓으로 내보낸다. 치명적 오류면 false (failure() == IoFailure).
    /// 1바이트라도 나가면 lastEgress() 를 now 로 갱신한다.
    [[nodiscard]] bool flush(TimePoint now) noexcept;

    [[nodiscard]] ChannelId id() const noexcept { return id_; }
    [[nodiscard]] ChannelState state() const noexcept { return state_; }
    [[nodiscard]] ClientId clientId() const noexcept { return clientId_; }
    [[nodiscard]] int fd() const noexcept { return socket_.nativeHandle(); }
    [[nodiscard]] bool peerClosed() const noexcept { return peerClosed_; }

    [[nodiscard]] protocol::DisconnectReason failure() const noexcept { return failure_; }

    [[nodiscard]] TimePoint createdAt() const noexcept { return createdAt_; }
    [[nodiscard]] TimePoint lastIngress() const noexcept { return lastIngress_; }
    [[nodiscard]] TimePoint lastEgress() const noexcept { return lastEgress_; }

    [[nodiscard]] bool hasPendingEgress() const noexcept { return !writeBuf_.empty(); }
    [[nodiscard]] std::size_t pendingEgress() const noexcept { return writeBuf_.size(); }
    [[nodiscard]] std::size_t bufferedIngress() const noexcept { return readBuf_.size() - consumePending_; }

    [[nodiscard]] std::uint64_t nextTxSequence() const noexcept { return txSeq_; }

  private:
    template <typename Fill>
    WriteStatus writeFrame_(protocol::FrameClass cls, std::size_t plainLen, Fill &&fill);

    WriteStatus writeControl_(protocol::FrameClass cls, std::span<const std::byte> body, TimePoint now);

    Transition promote_(const protocol::Frame &frame, std::uint64_t nowUnixSec) noexcept;

    void fail_(protocol::DisconnectReason reason) noexcept { failure_ = reason; }

    ChannelId id_;
    Socket socket_;
    crypto::Aead &aead_;
    const EndpointConfig &config_;

    buffer::Buffer readBuf_;
    buffer::Buffer writeBuf_;

    ChannelState state_{ChannelState::AwaitingToken};
    ClientId clientId_{0};

    crypto::Key rxKey_;
    crypto::Key txKey_{};
    protocol::ReplayGuard rxGuard_;
    std::uint64_t txSeq_{0};

    bool peerClosed_{false};
    std::size_t consumePending_{0}; ///< 직전 read() 가 돌려준 프레임 크기. 다음 read() 에서 소비

    protocol::DisconnectReason failure_{protocol::DisconnectReason::Requested};

    TimePoint createdAt_;
    TimePoint lastIngress_;
    TimePoint lastEgress_;
};

} // namespace gamenet::net
