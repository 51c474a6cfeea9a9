#include <gamenet/net/Channel.hpp>

#include <gamenet/core/Logger.hpp>
#include <gamenet/protocol/FrameCodec.hpp>
#include <gamenet/protocol/MessageCodec.hpp>

#include <array>
#include <cstring>
#include <utility>

namespace gamenet::net
{

using protocol::DisconnectReason;
using protocol::FrameClass;

std::string_view toString(ChannelState state) noexcept
{
    switch (state)
    {
    case ChannelState::AwaitingToken:
        return "awaiting_token";
    case ChannelState::Connected:
        return "connected";
    case ChannelState::Disconnected:
        return "disconnected";
    }
    return "unknown";
}

Channel::Channel(ChannelId id, Socket socket, buffer::ChunkPool &pool, crypto::Aead &aead,
                 const crypto::SecretKey &secret, const EndpointConfig &config, TimePoint now)
    : id_(id), socket_(std::move(socket)), aead_(aead), config_(config), readBuf_(pool),
      writeBuf_(pool), rxKey_(secret.key()), createdAt_(now), lastIngress_(now), lastEgress_(now)
{
}

// ---------------------------------------------------------------------------
// inbound
// ---------------------------------------------------------------------------

buffer::IoStatus Channel::receive(TimePoint now)
{
    if (peerClosed_)
    {
        return buffer::IoStatus::WouldBlock;
    }
    if (readBuf_.size() >= config_.maxIngressBytes)
    {
        // level-triggered 이므로 남은 바이트는 pull 로 비운 뒤 다음 poll 에서 읽는다.
        return buffer::IoStatus::WouldBlock;
    }

    const auto result = readBuf_.readFrom(socket_, config_.maxIngressBytes - readBuf_.size());
    if (result.bytes > 0)
    {
        lastIngress_ = now;
    }

    if (result.peerClosed())
    {
        peerClosed_ = true;
        SLOG_DEBUG("Channel", "PeerClosed", "cid={} bytes={} buffered={}", id_, result.bytes,
                   bufferedIngress());
    }
    if (result.failed())
    {
        fail_(DisconnectReason::IoFailure);
        SLOG_DEBUG("Channel", "RecvFailed", "cid={} errno={} msg='{}'", id_, result.error,
                   std::strerror(result.error));
    }
    return result.status;
}

ReadStatus Channel::read(protocol::Frame &out) noexcept
{
    if (consumePending_ > 0)
    {
        readBuf_.consume(consumePending_);
        consumePending_ = 0;
    }

    const auto head = readBuf_.contiguous(protocol::kHeaderSize);
    if (head.empty())
    {
        return ReadStatus::NeedMore;
    }

    protocol::Header header{};
    if (protocol::Header::parse(head, header) != protocol::HeaderParse::Parsed)
    {
        SLOG_WARN("Channel", "BadHeader", "cid={} class={}", id_, std::to_integer<int>(head[0]));
        fail_(DisconnectReason::Corruption);
        return ReadStatus::Fatal;
    }

    if (header.size < protocol::kTagSize || header.frameSize() > config_.maxFrameSize)
    {
        SLOG_WARN("Channel", "BadFrameSize", "cid={} size={} max={}", id_, header.size,
                  config_.maxFrameSize);
        fail_(DisconnectReason::Corruption);
        return ReadStatus::Fatal;
    }

    if (readBuf_.size() < header.frameSize())
    {
        return ReadStatus::NeedMore;
    }

    const auto frame = readBuf_.contiguous(header.frameSize());
    if (!protocol::openFrame(aead_, rxKey_, header, frame, out))
    {
        SLOG_WARN("Channel", "AuthFailed", "cid={} class={} seq={} size={}", id_,
                  protocol::toString(header.frameClass), header.sequence, header.size);
        fail_(DisconnectReason::Corruption);
        return ReadStatus::Fatal;
    }

    if (!rxGuard_.accept(header.sequence))
    {
        SLOG_WARN("Channel", "Replay", "cid={} seq={} last={}", id_, header.sequence,
                  rxGuard_.last().value_or(0));
        fail_(DisconnectReason::Replay);
        return ReadStatus::Fatal;
    }

    consumePending_ = header.frameSize();
    SLOG_TRACE("Channel", "Framed", "cid={} class={} seq={} body={}", id_,
               protocol::toString(out.frameClass), out.sequence, out.body.size());
    return ReadStatus::Framed;
}

// ---------------------------------------------------------------------------
// handshake state machine
// ---------------------------------------------------------------------------

Transition Channel::advance(const protocol::Frame &frame, std::uint64_t nowUnixSec) noexcept
{
    if (state_ == ChannelState::AwaitingToken)
    {
        return promote_(frame, nowUnixSec);
    }

    switch (frame.frameClass)
    {
    case FrameClass::Payload:
    case FrameClass::Keepalive:
        return Transition{ChannelState::Connected};

    case FrameClass::Disconnect:
    {
        DisconnectReason peerReason{};
        if (protocol::decodeDisconnect(frame.body, peerReason))
        {
            SLOG_DEBUG("Channel", "PeerDisconnect", "cid={} client={} peer_reason={}", id_,
                       clientId_, protocol::toString(peerReason));
        }
        return Transition{ChannelState::Disconnected, DisconnectReason::PeerDisconnect};
    }

    case FrameClass::Accepted:
    case FrameClass::Token:
        break;
    }

    SLOG_WARN("Channel", "UnexpectedControl", "cid={} client={} class={}", id_, clientId_,
              protocol::toString(frame.frameClass));
    return Transition{ChannelState::Disconnected, DisconnectReason::ProtocolViolation};
}

Transition Channel::promote_(const protocol::Frame &frame, std::uint64_t nowUnixSec) noexcept
{
    const Transition rejected{ChannelState::Disconnected, DisconnectReason::InvalidToken};

    if (frame.frameClass != FrameClass::Token)
    {
        SLOG_WARN("Channel", "HandshakeRejected", "cid={} reason=not_a_token class={}", id_,
                  protocol::toString(frame.frameClass));
        return rejected;
    }

    protocol::ConnectToken token{};
    if (!protocol::ConnectToken::decode(frame.body, token))
    {
        SLOG_WARN("Channel", "HandshakeRejected", "cid={} reason=malformed body={}", id_,
                  frame.body.size());
        return rejected;
    }

    const auto check = protocol::checkToken(token, config_.protocolId, config_.protocolVersion,
                                            nowUnixSec, frame.sequence);
    if (check != protocol::TokenCheck::Ok)
    {
        SLOG_WARN("Channel", "HandshakeRejected", "cid={} reason={} client={}", id_,
                  protocol::toString(check), token.data.clientId);
        return rejected;
    }

    rxKey_ = token.data.serverKey;
    txKey_ = token.data.clientKey;
    clientId_ = token.data.clientId;
    state_ = ChannelState::Connected;

    // 새 키로 새 sequence 공간이 시작된다.
    rxGuard_.reset();

    SLOG_DEBUG("Channel", "Promoted", "cid={} client={} expire={}", id_, clientId_,
               token.expireUnixSec);
    return Transition{ChannelState::Connected};
}

// ---------------------------------------------------------------------------
// outbound
// ---------------------------------------------------------------------------

template <typename Fill>
WriteStatus Channel::writeFrame_(FrameClass cls, std::size_t plainLen, Fill &&fill)
{
    if (state_ != ChannelState::Connected)
    {
        SLOG_ERROR("Channel", "WriteBeforeHandshake", "cid={} class={}", id_,
                   protocol::toString(cls));
        fail_(DisconnectReason::ProtocolViolation);
        return WriteStatus::Fatal;
    }

    const std::size_t frameLen = protocol::frameSizeFor(plainLen);
    if (writeBuf_.size() + frameLen > config_.maxEgressBytes)
    {
        return WriteStatus::Wait;
    }

    const auto frame = writeBuf_.reserve(frameLen);
    if (frame.size() != frameLen || !fill(protocol::plainArea(frame)))
    {
        SLOG_ERROR("Channel", "FrameBuildFailed", "cid={} class={} len={}", id_,
                   protocol::toString(cls), frameLen);
        fail_(DisconnectReason::ProtocolViolation);
        return WriteStatus::Fatal;
    }

    if (!protocol::sealFrame(aead_, txKey_, cls, txSeq_, frame))
    {
        SLOG_ERROR("Channel", "SealFailed", "cid={} class={} seq={}", id_, protocol::toString(cls),
                   txSeq_);
        fail_(DisconnectReason::Corruption);
        return WriteStatus::Fatal;
    }

    writeBuf_.commit(frameLen);
    ++txSeq_;
    return WriteStatus::Written;
}

WriteStatus Channel::writeControl_(FrameClass cls, std::span<const std::byte> body, TimePoint now)
{
    const auto status = writeFrame_(cls, body.size(), [body](std::span<std::byte> plain) {
        if (!body.empty())
            std::memcpy(plain.data(), body.data(), body.size());
        return true;
    });
    if (status != WriteStatus::Written)
    {
        return status;
    }
    return flush(now) ? WriteStatus::Written : WriteStatus::Fatal;
}

WriteStatus Channel::sendKeepalive(TimePoint now)
{
    return writeControl_(FrameClass::Keepalive, {}, now);
}

WriteStatus Channel::sendAccepted(TimePoint now)
{
    std::array<std::byte, protocol::kAcceptedBodySize> body{};
    protocol::SpanWriter w(body);
    if (!protocol::encodeAccepted(w, clientId_))
    {
        return WriteStatus::Fatal;
    }
    return writeControl_(FrameClass::Accepted, body, now);
}

WriteStatus Channel::sendDisconnect(DisconnectReason reason, TimePoint now)
{
    std::array<std::byte, protocol::kDisconnectBodySize> body{};
    protocol::SpanWriter w(body);
    if (!protocol::encodeDisconnect(w, reason))
    {
        return WriteStatus::Fatal;
    }
    return writeControl_(FrameClass::Disconnect, body, now);
}

WriteStatus Channel::writePayload(protocol::PayloadBatch &batch, TimePoint now)
{
    const std::size_t maxPlain = config_.maxFrameSize - protocol::kMinFrameSize;
    WriteStatus status = WriteStatus::Written;

    while (!batch.empty())
    {
        if (protocol::PayloadBatch::encodedSize(batch[0].size()) > maxPlain)
        {
            SLOG_WARN("Channel", "MessageTooLarge", "cid={} client={} len={} max={}", id_,
                      clientId_, batch[0].size(),
                      maxPlain - protocol::PayloadBatch::kLengthPrefixSize);
            batch.dropFront(1);
            continue;
        }

        // 한 프레임에 들어가는 만큼 앞에서부터 모은다.
        std::size_t count = 0;
        std::size_t plainLen = 0;
        while (count < batch.size())
        {
            const std::size_t need = protocol::PayloadBatch::encodedSize(batch[count].size());
            if (plainLen + need > maxPlain)
                break;
            plainLen += need;
            ++count;
        }

        status = writeFrame_(FrameClass::Payload, plainLen,
                             [&batch, count](std::span<std::byte> plain) {
                                 protocol::SpanWriter w(plain);
                                 for (std::size_t i = 0; i < count; ++i)
                                 {
                                     const auto msg = batch[i];
                                     if (!w.writeU16Be(static_cast<std::uint16_t>(msg.size())) ||
                                         !w.writeBytes(msg))
                                         return false;
                                 }
                                 return w.remaining() == 0;
                             });
        if (status != WriteStatus::Written)
        {
            break;
        }
        batch.dropFront(count);
    }

    if (status == WriteStatus::Fatal)
    {
        return status;
    }
    if (!flush(now))
    {
        return WriteStatus::Fatal;
    }
    return status;
}

bool Channel::flush(TimePoint now) noexcept
{
    if (writeBuf_.empty())
    {
        return true;
    }

    const auto result = writeBuf_.writeTo(socket_);
    if (result.bytes > 0)
    {
        lastEgress_ = now;
    }
    if (result.failed())
    {
        SLOG_DEBUG("Channel", "SendFailed", "cid={} errno={} msg='{}'", id_, result.error,
                   std::strerror(result.error));
        fail_(DisconnectReason::IoFailure);
        return false;
    }
    return true;
}

} // namespace gamenet::net
