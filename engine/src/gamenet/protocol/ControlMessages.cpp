#include <gamenet/protocol/ControlMessages.hpp>

namespace gamenet::protocol
{

std::string_view toString(DisconnectReason reason) noexcept
{
    switch (reason)
    {
    case DisconnectReason::Requested:
        return "requested";
    case DisconnectReason::IoFailure:
        return "io_failure";
    case DisconnectReason::Corruption:
        return "corruption";
    case DisconnectReason::Replay:
        return "replay";
    case DisconnectReason::HandshakeTimeout:
        return "handshake_timeout";
    case DisconnectReason::IdleTimeout:
        return "idle_timeout";
    case DisconnectReason::InvalidToken:
        return "invalid_token";
    case DisconnectReason::ProtocolViolation:
        return "protocol_violation";
    case DisconnectReason::PeerDisconnect:
        return "peer_disconnect";
    case DisconnectReason::Shutdown:
        return "shutdown";
    }
    return "unknown";
}

std::string_view toString(TokenCheck check) noexcept
{
    switch (check)
    {
    case TokenCheck::Ok:
        return "ok";
    case TokenCheck::ProtocolMismatch:
        return "protocol_mismatch";
    case TokenCheck::VersionMismatch:
        return "version_mismatch";
    case TokenCheck::Expired:
        return "expired";
    case TokenCheck::ChallengeMismatch:
        return "challenge_mismatch";
    }
    return "unknown";
}

bool ConnectToken::encode(SpanWriter &w) const noexcept
{
    return w.writeU16Be(protocolId) && w.writeU16Be(version) && w.writeU64Be(expireUnixSec) &&
           w.writeU64Be(challengeSequence) && w.writeU64Be(data.clientId) &&
           w.writeBytes(data.serverKey) && w.writeBytes(data.clientKey);
}

bool ConnectToken::decode(std::span<const std::byte> body, ConnectToken &out) noexcept
{
    if (body.size() != kBodySize)
    {
        return false;
    }

    ByteReader r(body);
    ConnectToken t{};
    const bool ok = r.readU16Be(t.protocolId) && r.readU16Be(t.version) &&
                    r.readU64Be(t.expireUnixSec) && r.readU64Be(t.challengeSequence) &&
                    r.readU64Be(t.data.clientId) && r.readBytes(t.data.serverKey) &&
                    r.readBytes(t.data.clientKey);
    if (!ok || !r.atEnd())
    {
        return false;
    }

    out = t;
    return true;
}

TokenCheck checkToken(const ConnectToken &token, std::uint16_t protocolId, std::uint16_t version,
                      std::uint64_t nowUnixSec, std::uint64_t headerSequence) noexcept
{
    if (token.protocolId != protocolId)
        return TokenCheck::ProtocolMismatch;
    if (token.version != version)
        return TokenCheck::VersionMismatch;
    if (token.expireUnixSec <= nowUnixSec)
        return TokenCheck::Expired;
    if (token.challengeSequence != headerSequence)
        return TokenCheck::ChallengeMismatch;
    return TokenCheck::Ok;
}

bool encodeAccepted(SpanWriter &w, std::uint64_t clientId) noexcept
{
    return w.writeU64Be(clientId);
}

bool decodeAccepted(std::span<const std::byte> body, std::uint64_t &clientId) noexcept
{
    ByteReader r(body);
    return r.readU64Be(clientId) && r.atEnd();
}

bool encodeDisconnect(SpanWriter &w, DisconnectReason reason) noexcept
{
    return w.writeU8(static_cast<std::uint8_t>(reason));
}

bool decodeDisconnect(std::span<const std::byte> body, DisconnectReason &reason) noexcept
{
    ByteReader r(body);
    std::uint8_t raw = 0;
    if (!r.readU8(raw) || !r.atEnd() || raw > kMaxDisconnectReason)
    {
        return false;
    }
    reason = static_cast<DisconnectReason>(raw);
    return true;
}

} // namespace gamenet::protocol
