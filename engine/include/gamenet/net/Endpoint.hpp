#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <gamenet/EndpointConfig.hpp>
#include <gamenet/Replicator.hpp>
#include <gamenet/buffer/ChunkPool.hpp>
#include <gamenet/crypto/Aead.hpp>
#include <gamenet/crypto/Key.hpp>
#include <gamenet/net/Acceptor.hpp>
#include <gamenet/net/Channel.hpp>
#include <gamenet/net/ConnectionChange.hpp>
#include <gamenet/net/EpollReactor.hpp>
#include <gamenet/protocol/PayloadBatch.hpp>
#include <gamenet/util/NonCopyable.hpp>

namespace gamenet::net
{

/// 리스너와 모든 채널을 소유하고 틱 루프에서 구동되는 서버 측 연결 관리자입니다.
///
/// ===== 스레딩 =====
/// - 단일 스레드 전용. 모든 메서드는 게임 루프 스레드에서만 호출한다.
/// - 블로킹 지점은 없다. poll 은 항상 timeout 0 이다.
///
/// ===== 채널 컬렉션 =====
/// - 채널은 슬롯 벡터에 있고 ChannelId 는 슬롯 번호다.
/// - AwaitingToken / Connected 채널 id 는 별도 목록에 있어 상태별 sweep 이 전체를 훑지 않는다.
///
/// ===== 실패 보고 =====
/// - 어떤 메서드도 채널 오류를 반환값이나 예외로 올리지 않는다.
///   치명적 상황은 즉시 teardown 하고 changes() 에 Disconnected 로 남긴다.
/// - 예외는 생성자(소켓/epoll/설정 오류)에서만 던진다.
class Endpoint : private gamenet::util::NonMovable
{
  public:
    /// secret 은 Endpoint 보다 오래 살아야 한다.
    Endpoint(EndpointConfig config, const crypto::SecretKey &secret);
    ~Endpoint();

    /// 한 틱의 네트워크 처리.
    /// 1) Connected 채널 송신 버퍼 flush
    /// 2) timeout 0 poll: accept, 수신, 핸드셰이크, writable flush
    /// 3) housekeepingInterval 이 지났으면 housekeeping(now)
    void sync(TimePoint now = Clock::now());

    /// 타임아웃 sweep 과 keepalive. 보통 sync() 가 주기에 맞춰 부른다.
    void housekeeping(TimePoint now);

    /// 이미 받아 둔 Payload 프레임들의 메시지를 out 뒤에 붙인다.
    /// 치명적 오류면 out 을 호출 전 크기로 되돌리고 채널을 끊는다.
    /// 상대의 Disconnect 는 오류가 아니므로 그 앞의 메시지는 남는다.
    /// 상대가 소켓을 닫았으면 남은 프레임을 다 꺼낸 뒤 IoFailure 로 끊는다.
    void pull(ChannelId id, protocol::PayloadBatch &out);

    /// batch 앞에서부터 보낼 수 있는 만큼 프레임으로 만들어 보내고 batch 에서 뺀다.
    /// 송신 버퍼가 차면 나머지는 batch 에 남는다.
    void push(ChannelId id, protocol::PayloadBatch &batch);

    /// Connected 채널마다 scratch 를 비우고 replicator.record() 로 채운 뒤 push 한다.
    void replicate(IReplicator &replicator, protocol::PayloadBatch &scratch);

    /// Disconnect 통지를 시도하고(best-effort) 채널을 해제한다. 없는 id 면 아무 일도 없다.
    void disconnect(ChannelId id,
                    protocol::DisconnectReason reason = protocol::DisconnectReason::Requested);

    /// 모든 채널을 Shutdown 사유로 해제한다.
    void shutdown();

    /// 지난 호출 이후 쌓인 연결 이벤트를 발생 순서대로 넘기고 비운다.
    [[nodiscard]] std::vector<ConnectionChange> changes();

    [[nodiscard]] std::uint16_t listenPort() const noexcept { return acceptor_.listenPort(); }
    [[nodiscard]] std::size_t awaitingCount() const noexcept { return awaiting_.size(); }
    [[nodiscard]] std::size_t connectedCount() const noexcept { return connected_.size(); }
    [[nodiscard]] std::span<const ChannelId> connectedChannels() const noexcept { return connected_; }

    /// Connected 채널의 클라이언트 id
    [[nodiscard]] std::optional<ClientId> clientId(ChannelId id) const noexcept;

    [[nodiscard]] const EndpointConfig &config() const noexcept { return config_; }
    [[nodiscard]] const buffer::ChunkPool &chunkPool() const noexcept { return pool_; }

  private:
    static constexpr std::uint64_t kListenerToken = std::numeric_limits<std::uint64_t>::max();

    struct Slot
    {
        std::unique_ptr<Channel> channel;
        std::uint32_t generation{0};   ///< 재사용된 슬롯에 늦게 도착한 이벤트를 걸러낸다
        ChannelState listed{ChannelState::AwaitingToken};
        std::size_t position{0};       ///< awaiting_ 또는 connected_ 안의 위치
        bool wantWrite{false};         ///< EPOLLOUT 등록 여부
    };

    [[nodiscard]] static std::uint64_t tokenOf(ChannelId id, std::uint32_t generation) noexcept
    {
        return (static_cast<std::uint64_t>(generation) << 32) | id;
    }

    [[nodiscard]] Channel *live_(ChannelId id) const noexcept;
    [[nodiscard]] Channel *connectedChannel_(ChannelId id) const noexcept;

    void acceptPending_();
    void admit_(Socket &&client, const Acceptor::PeerEndpoint &peer);
    void onEvent_(const EpollReactor::ReadyEvent &ev);
    void processHandshake_(ChannelId id, Channel &ch);

    void flushConnected_();
    void updateInterest_(ChannelId id);

    void list_(ChannelId id, ChannelState state);
    void unlist_(ChannelId id);
    void teardown_(ChannelId id, protocol::DisconnectReason reason);

    [[nodiscard]] static std::uint64_t unixNow_() noexcept;

    EndpointConfig config_;
    const crypto::SecretKey &secret_;

    // 채널들이 빌려 쓰므로 slots_ 보다 먼저 선언(나중에 파괴)한다.
    buffer::ChunkPool pool_;
    crypto::Aead aead_;
    EpollReactor reactor_;
    Acceptor acceptor_;

    std::vector<Slot> slots_;
    std::vector<ChannelId> freeSlots_;
    std::vector<ChannelId> awaiting_;
    std::vector<ChannelId> connected_;
    std::vector<ChannelId> sweep_; ///< 순회 중 해제가 일어날 수 있어 id 를 복사해 둔다

    std::vector<ConnectionChange> changes_;

    TimePoint now_;
    TimePoint lastHousekeeping_;
};

} // namespace gamenet::net
