#include <gamenet/net/Endpoint.hpp>

#include <gamenet/core/Logger.hpp>

#include <cerrno>
#include <chrono>
#include <system_error>
#include <utility>

namespace gamenet::net
{

using protocol::DisconnectReason;

namespace
{
EndpointConfig validated(EndpointConfig config)
{
    validateEndpointConfig(config);
    return config;
}

std::chrono::milliseconds ms(std::uint32_t v) noexcept
{
    return std::chrono::milliseconds{v};
}

/// 상대가 이미 없거나(IoFailure) 스스로 끊었거나(PeerDisconnect) 응답이 없는(IdleTimeout)
/// 경우에는 통지를 보내지 않는다.
bool wantsNotice(DisconnectReason reason) noexcept
{
    switch (reason)
    {
    case DisconnectReason::IoFailure:
    case DisconnectReason::PeerDisconnect:
    case DisconnectReason::IdleTimeout:
        return false;
    default:
        return true;
    }
}

constexpr std::uint32_t kBaseInterest = EpollReactor::makeEventMask(
    {EpollReactor::Event::Read, EpollReactor::Event::ReadHangup});
constexpr std::uint32_t kWriteInterest = kBaseInterest | EPOLLOUT;
} // namespace

Endpoint::Endpoint(EndpointConfig config, const crypto::SecretKey &secret)
    : config_(validated(std::move(config))), secret_(secret), pool_(config_.chunkSize),
      reactor_(config_.maxPollEvents),
      acceptor_(config_.listenAddress, config_.listenPort, config_.listenBacklog),
      now_(Clock::now()), lastHousekeeping_(now_)
{
    if (!reactor_.registerFd(acceptor_.nativeHandle(), kListenerToken, kBaseInterest))
    {
        throw std::system_error(errno, std::generic_category(),
                                "Endpoint: failed to register listener");
    }

    SLOG_INFO("Endpoint", "Started",
              "addr={} port={} chunk={} max_frame={} handshake_ms={} idle_ms={} keepalive_ms={} "
              "key={}",
              config_.listenAddress, acceptor_.listenPort(), config_.chunkSize,
              config_.maxFrameSize, config_.handshakeTimeoutMs, config_.idleTimeoutMs,
              config_.keepaliveIntervalMs, secret_.fingerprint());
}

Endpoint::~Endpoint()
{
    SLOG_DEBUG("Endpoint", "Destroyed", "awaiting={} connected={} chunks={}", awaiting_.size(),
               connected_.size(), pool_.totalChunks());
}

// ---------------------------------------------------------------------------
// lookup / collections
// ---------------------------------------------------------------------------

Channel *Endpoint::live_(ChannelId id) const noexcept
{
    if (id >= slots_.size())
    {
        return nullptr;
    }
    return slots_[id].channel.get();
}

Channel *Endpoint::connectedChannel_(ChannelId id) const noexcept
{
    Channel *ch = live_(id);
    if (ch == nullptr || slots_[id].listed != ChannelState::Connected)
    {
        return nullptr;
    }
    return ch;
}

std::optional<ClientId> Endpoint::clientId(ChannelId id) const noexcept
{
    const Channel *ch = connectedChannel_(id);
    if (ch == nullptr)
    {
        return std::nullopt;
    }
    return ch->clientId();
}

void Endpoint::list_(ChannelId id, ChannelState state)
{
    auto &ids = (state == ChannelState::Connected) ? connected_ : awaiting_;
    Slot &slot = slots_[id];
    slot.listed = state;
    slot.position = ids.size();
    ids.push_back(id);
}

void Endpoint::unlist_(ChannelId id)
{
    Slot &slot = slots_[id];
    auto &ids = (slot.listed == ChannelState::Connected) ? connected_ : awaiting_;

    // swap-remove: 마지막 원소를 빈자리로 옮기고 위치를 갱신한다.
    const ChannelId moved = ids.back();
    ids[slot.position] = moved;
    slots_[moved].position = slot.position;
    ids.pop_back();
}

// ---------------------------------------------------------------------------
// tick
// ---------------------------------------------------------------------------

void Endpoint::sync(TimePoint now)
{
    now_ = now;

    flushConnected_();

    for (const auto &ev : reactor_.wait(0))
    {
        onEvent_(ev);
    }

    if (now_ - lastHousekeeping_ >= ms(config_.housekeepingIntervalMs))
    {
        housekeeping(now_);
    }
}

void Endpoint::flushConnected_()
{
    sweep_.assign(connected_.begin(), connected_.end());
    for (const ChannelId id : sweep_)
    {
        Channel *ch = live_(id);
        if (ch == nullptr)
        {
            continue;
        }
        // 지난 틱에 EOF 를 봤고 pull() 이 Disconnect 를 찾지 못했다.
        if (ch->peerClosed())
        {
            teardown_(id, DisconnectReason::IoFailure);
            continue;
        }
        if (!ch->flush(now_))
        {
            teardown_(id, ch->failure());
            continue;
        }
        updateInterest_(id);
    }
}

void Endpoint::onEvent_(const EpollReactor::ReadyEvent &ev)
{
    if (ev.token == kListenerToken)
    {
        if (ev.events & (EPOLLERR | EPOLLHUP))
        {
            SLOG_ERROR("Endpoint", "ListenerError", "events=0x{:x}", ev.events);
            return;
        }
        acceptPending_();
        return;
    }

    const auto id = static_cast<ChannelId>(ev.token & 0xFFFF'FFFFu);
    const auto generation = static_cast<std::uint32_t>(ev.token >> 32);
    Channel *ch = live_(id);
    if (ch == nullptr || slots_[id].generation != generation)
    {
        return; // 같은 배치 안에서 먼저 해제된 채널
    }

    if (ev.events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR))
    {
        if (ch->receive(now_) == buffer::IoStatus::Failed)
        {
            teardown_(id, ch->failure());
            return;
        }
        if (slots_[id].listed == ChannelState::AwaitingToken)
        {
            processHandshake_(id, *ch);
            if (live_(id) == nullptr)
            {
                return;
            }
            if (ch->peerClosed() && slots_[id].listed == ChannelState::AwaitingToken)
            {
                teardown_(id, DisconnectReason::IoFailure);
                return;
            }
        }
        // Connected 채널은 EOF 여도 남은 프레임을 pull() 로 꺼낸 뒤 다음 sync 에서 정리한다.
    }

    if (ev.events & EPOLLOUT)
    {
        if (!ch->flush(now_))
        {
            teardown_(id, ch->failure());
            return;
        }
        updateInterest_(id);
    }
}

void Endpoint::acceptPending_()
{
    const std::size_t n = acceptor_.acceptPending(
        [this](Socket &&client, const Acceptor::PeerEndpoint &peer) { admit_(std::move(client), peer); });
    if (n > 0)
    {
        SLOG_DEBUG("Endpoint", "Accepted", "count={} awaiting={}", n, awaiting_.size());
    }
}

void Endpoint::admit_(Socket &&client, const Acceptor::PeerEndpoint &peer)
{
    ChannelId id = 0;
    if (!freeSlots_.empty())
    {
        id = freeSlots_.back();
        freeSlots_.pop_back();
    }
    else
    {
        id = static_cast<ChannelId>(slots_.size());
        slots_.emplace_back();
    }

    Slot &slot = slots_[id];
    ++slot.generation;
    slot.wantWrite = false;
    slot.channel = std::make_unique<Channel>(id, std::move(client), pool_, aead_, secret_, config_, now_);

    if (!reactor_.registerFd(slot.channel->fd(), tokenOf(id, slot.generation), kBaseInterest))
    {
        // 한 번도 보고되지 않은 채널이므로 이벤트 없이 조용히 반납한다.
        SLOG_ERROR("Endpoint", "RegisterFailed", "cid={} peer={}:{}", id, peer.ip, peer.port);
        slot.channel.reset();
        freeSlots_.push_back(id);
        return;
    }

    list_(id, ChannelState::AwaitingToken);
    SLOG_DEBUG("Endpoint", "ChannelOpened", "cid={} peer={}:{} fd={}", id, peer.ip, peer.port,
               slot.channel->fd());
}

void Endpoint::processHandshake_(ChannelId id, Channel &ch)
{
    protocol::Frame frame{};
    switch (ch.read(frame))
    {
    case ReadStatus::NeedMore:
        return;
    case ReadStatus::Fatal:
        teardown_(id, ch.failure());
        return;
    case ReadStatus::Framed:
        break;
    }

    const Transition t = ch.advance(frame, unixNow_());
    if (t.next != ChannelState::Connected)
    {
        teardown_(id, t.reason);
        return;
    }

    // 토큰 뒤에 같이 온 프레임은 새 키로 열리므로 pull() 에 맡긴다.
    unlist_(id);
    list_(id, ChannelState::Connected);
    changes_.push_back(ConnectionChange::connected(id, ch.clientId()));

    SLOG_INFO("Endpoint", "Connected", "cid={} client={} fd={}", id, ch.clientId(), ch.fd());

    if (ch.sendAccepted(now_) == WriteStatus::Fatal)
    {
        teardown_(id, ch.failure());
        return;
    }
    updateInterest_(id);
}

void Endpoint::updateInterest_(ChannelId id)
{
    Slot &slot = slots_[id];
    const bool want = slot.channel->hasPendingEgress();
    if (want == slot.wantWrite)
    {
        return;
    }

    if (reactor_.modifyFd(slot.channel->fd(), tokenOf(id, slot.generation),
                          want ? kWriteInterest : kBaseInterest))
    {
        slot.wantWrite = want;
    }
}

// ---------------------------------------------------------------------------
// housekeeping
// ---------------------------------------------------------------------------

void Endpoint::housekeeping(TimePoint now)
{
    now_ = now;
    lastHousekeeping_ = now;

    sweep_.assign(awaiting_.begin(), awaiting_.end());
    for (const ChannelId id : sweep_)
    {
        const Channel *ch = live_(id);
        if (ch != nullptr && now - ch->createdAt() >= ms(config_.handshakeTimeoutMs))
        {
            teardown_(id, DisconnectReason::HandshakeTimeout);
        }
    }

    std::size_t keepalives = 0;
    sweep_.assign(connected_.begin(), connected_.end());
    for (const ChannelId id : sweep_)
    {
        Channel *ch = live_(id);
        if (ch == nullptr)
        {
            continue;
        }

        if (now - ch->lastIngress() >= ms(config_.idleTimeoutMs))
        {
            teardown_(id, DisconnectReason::IdleTimeout);
            continue;
        }

        if (!ch->hasPendingEgress() && now - ch->lastEgress() >= ms(config_.keepaliveIntervalMs))
        {
            if (ch->sendKeepalive(now) == WriteStatus::Fatal)
            {
                teardown_(id, ch->failure());
                continue;
            }
            ++keepalives;
            updateInterest_(id);
        }
    }

    SLOG_TRACE("Endpoint", "Housekeeping", "awaiting={} connected={} keepalives={} idle_chunks={}",
               awaiting_.size(), connected_.size(), keepalives, pool_.idleChunks());
}

// ---------------------------------------------------------------------------
// game-layer API
// ---------------------------------------------------------------------------

void Endpoint::pull(ChannelId id, protocol::PayloadBatch &out)
{
    Channel *ch = connectedChannel_(id);
    if (ch == nullptr)
    {
        return;
    }

    const std::size_t before = out.size();
    const std::uint64_t nowUnix = unixNow_();

    for (;;)
    {
        protocol::Frame frame{};
        const ReadStatus status = ch->read(frame);
        if (status == ReadStatus::NeedMore)
        {
            if (ch->peerClosed())
            {
                teardown_(id, DisconnectReason::IoFailure);
            }
            return;
        }
        if (status == ReadStatus::Fatal)
        {
            out.truncate(before);
            teardown_(id, ch->failure());
            return;
        }

        const Transition t = ch->advance(frame, nowUnix);
        if (t.next != ChannelState::Connected)
        {
            // 정상 종료면 Disconnect 앞에 온 메시지는 살린다.
            if (t.reason != DisconnectReason::PeerDisconnect)
            {
                out.truncate(before);
            }
            teardown_(id, t.reason);
            return;
        }

        if (frame.frameClass == protocol::FrameClass::Payload && !out.appendFromBody(frame.body))
        {
            SLOG_WARN("Endpoint", "MalformedPayload", "cid={} client={} body={}", id,
                      ch->clientId(), frame.body.size());
            out.truncate(before);
            teardown_(id, DisconnectReason::Corruption);
            return;
        }
    }
}

void Endpoint::push(ChannelId id, protocol::PayloadBatch &batch)
{
    Channel *ch = connectedChannel_(id);
    if (ch == nullptr)
    {
        SLOG_DEBUG("Endpoint", "PushToUnknown", "cid={} messages={}", id, batch.size());
        return;
    }

    switch (ch->writePayload(batch, now_))
    {
    case WriteStatus::Fatal:
        teardown_(id, ch->failure());
        return;
    case WriteStatus::Wait:
        SLOG_DEBUG("Endpoint", "EgressFull", "cid={} pending={} left={}", id, ch->pendingEgress(),
                   batch.size());
        break;
    case WriteStatus::Written:
        break;
    }
    updateInterest_(id);
}

void Endpoint::replicate(IReplicator &replicator, protocol::PayloadBatch &scratch)
{
    sweep_.assign(connected_.begin(), connected_.end());
    for (const ChannelId id : sweep_)
    {
        const Channel *ch = connectedChannel_(id);
        if (ch == nullptr)
        {
            continue;
        }

        // 이전 클라이언트 메시지가 섞이지 않도록 매번 비운다.
        scratch.clear();
        replicator.record(ch->clientId(), scratch);
        push(id, scratch);
    }
    scratch.clear();
}

void Endpoint::disconnect(ChannelId id, DisconnectReason reason)
{
    if (live_(id) == nullptr)
    {
        return;
    }
    teardown_(id, reason);
}

void Endpoint::shutdown()
{
    const std::size_t total = awaiting_.size() + connected_.size();

    while (!connected_.empty())
    {
        teardown_(connected_.back(), DisconnectReason::Shutdown);
    }
    while (!awaiting_.empty())
    {
        teardown_(awaiting_.back(), DisconnectReason::Shutdown);
    }

    SLOG_INFO("Endpoint", "Shutdown", "channels={} chunks={} idle_chunks={}", total,
              pool_.totalChunks(), pool_.idleChunks());
}

std::vector<ConnectionChange> Endpoint::changes()
{
    return std::exchange(changes_, {});
}

// ---------------------------------------------------------------------------
// teardown
// ---------------------------------------------------------------------------

void Endpoint::teardown_(ChannelId id, DisconnectReason reason)
{
    Slot &slot = slots_[id];
    Channel &ch = *slot.channel;
    const bool wasConnected = slot.listed == ChannelState::Connected;

    if (wasConnected && wantsNotice(reason))
    {
        const WriteStatus sent = ch.sendDisconnect(reason, now_);
        if (sent != WriteStatus::Written)
        {
            SLOG_DEBUG("Endpoint", "NoticeNotSent", "cid={} reason={}", id,
                       protocol::toString(reason));
        }
    }

    if (!reactor_.unregisterFd(ch.fd()))
    {
        SLOG_DEBUG("Endpoint", "UnregisterFailed", "cid={} fd={} errno={}", id, ch.fd(), errno);
    }
    unlist_(id);

    const ClientId client = ch.clientId();
    const int fd = ch.fd();

    // 채널 파괴: 버퍼 청크는 풀로, 소켓은 닫힌다.
    slot.channel.reset();
    slot.wantWrite = false;
    freeSlots_.push_back(id);

    changes_.push_back(ConnectionChange::disconnected(id, client, reason));

    SLOG_INFO("Endpoint", "Disconnected", "cid={} client={} fd={} reason={} was={}", id, client, fd,
              protocol::toString(reason), wasConnected ? "connected" : "awaiting_token");
}

std::uint64_t Endpoint::unixNow_() noexcept
{
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace gamenet::net
