#include <gamenet/protocol/ControlMessages.hpp>
#include <gamenet/protocol/MessageCodec.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>

using namespace gamenet::protocol;

namespace {

ConnectToken sampleToken() {
    ConnectToken t{};
    t.protocolId = 0x4750;
    t.version = 3;
    t.expireUnixSec = 2'000'000'000ULL;
    t.challengeSequence = 77;
    t.data.clientId = 0xC0FFEE;
    t.data.serverKey.fill(std::byte{0x11});
    t.data.clientKey.fill(std::byte{0x22});
    return t;
}

bool test_token_body_layout() {
    std::array<std::byte, ConnectToken::kBodySize> body{};
    SpanWriter w(body);
    if (!sampleToken().encode(w) || w.offset() != ConnectToken::kBodySize) {
        std::cerr << "[token] encode should fill exactly kBodySize\n";
        return false;
    }

    // protocolId 는 big-endian 으로 맨 앞
    if (body[0] != std::byte{0x47} || body[1] != std::byte{0x50}) {
        std::cerr << "[token] protocolId layout mismatch\n";
        return false;
    }

    ConnectToken out{};
    if (!ConnectToken::decode(body, out)) {
        std::cerr << "[token] decode failed\n";
        return false;
    }
    const auto in = sampleToken();
    return out.protocolId == in.protocolId && out.version == in.version &&
           out.expireUnixSec == in.expireUnixSec && out.challengeSequence == in.challengeSequence &&
           out.data.clientId == in.data.clientId && out.data.serverKey == in.data.serverKey &&
           out.data.clientKey == in.data.clientKey;
}

bool test_token_encode_needs_room() {
    std::array<std::byte, ConnectToken::kBodySize - 1> small{};
    SpanWriter w(small);
    if (sampleToken().encode(w)) {
        std::cerr << "[token] encode into short span should fail\n";
        return false;
    }
    return true;
}

bool test_token_decode_rejects_wrong_length() {
    std::array<std::byte, ConnectToken::kBodySize + 1> body{};
    ConnectToken out{};
    if (ConnectToken::decode(body, out)) {
        std::cerr << "[token] trailing byte should be rejected\n";
        return false;
    }
    if (ConnectToken::decode(std::span<const std::byte>(body.data(), ConnectToken::kBodySize - 1), out)) {
        std::cerr << "[token] short body should be rejected\n";
        return false;
    }
    return true;
}

bool test_check_token() {
    const auto t = sampleToken();
    const std::uint64_t now = 1'900'000'000ULL;

    if (checkToken(t, 0x4750, 3, now, 77) != TokenCheck::Ok) {
        std::cerr << "[check] valid token rejected\n";
        return false;
    }
    if (checkToken(t, 0x4751, 3, now, 77) != TokenCheck::ProtocolMismatch) {
        std::cerr << "[check] protocol mismatch not detected\n";
        return false;
    }
    if (checkToken(t, 0x4750, 4, now, 77) != TokenCheck::VersionMismatch) {
        std::cerr << "[check] version mismatch not detected\n";
        return false;
    }
    // 만료 시각과 같은 순간부터 만료다.
    if (checkToken(t, 0x4750, 3, t.expireUnixSec, 77) != TokenCheck::Expired) {
        std::cerr << "[check] expiry boundary not detected\n";
        return false;
    }
    if (checkToken(t, 0x4750, 3, now, 78) != TokenCheck::ChallengeMismatch) {
        std::cerr << "[check] challenge mismatch not detected\n";
        return false;
    }
    return true;
}

bool test_accepted_body() {
    std::array<std::byte, kAcceptedBodySize> body{};
    SpanWriter w(body);
    if (!encodeAccepted(w, 42)) {
        return false;
    }

    std::uint64_t id = 0;
    if (!decodeAccepted(body, id) || id != 42) {
        std::cerr << "[accepted] clientId mismatch\n";
        return false;
    }

    std::array<std::byte, kAcceptedBodySize + 1> longer{};
    return !decodeAccepted(longer, id);
}

bool test_disconnect_body() {
    std::array<std::byte, kDisconnectBodySize> body{};
    SpanWriter w(body);
    if (!encodeDisconnect(w, DisconnectReason::IdleTimeout)) {
        return false;
    }

    DisconnectReason reason{};
    if (!decodeDisconnect(body, reason) || reason != DisconnectReason::IdleTimeout) {
        std::cerr << "[disconnect] reason mismatch\n";
        return false;
    }

    body[0] = static_cast<std::byte>(kMaxDisconnectReason + 1);
    if (decodeDisconnect(body, reason)) {
        std::cerr << "[disconnect] unknown reason should be rejected\n";
        return false;
    }
    return !decodeDisconnect({}, reason);
}

bool test_reason_names() {
    return toString(DisconnectReason::Replay) == "replay" &&
           toString(DisconnectReason::HandshakeTimeout) == "handshake_timeout" &&
           toString(TokenCheck::Expired) == "expired";
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_token_body_layout();
    ok = ok && test_token_encode_needs_room();
    ok = ok && test_token_decode_rejects_wrong_length();
    ok = ok && test_check_token();
    ok = ok && test_accepted_body();
    ok = ok && test_disconnect_body();
    ok = ok && test_reason_names();

    if (!ok) {
        std::cerr << "ControlMessages tests FAILED\n";
        return 1;
    }

    std::cout << "ControlMessages tests PASSED\n";
    return 0;
}
