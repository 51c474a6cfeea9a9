#pragma once

// 테스트 전용 클라이언트 측 프로토콜 구현. 프레임을 직접 봉인/해제한다.

#include <gamenet/crypto/Aead.hpp>
#include <gamenet/crypto/Key.hpp>
#include <gamenet/net/Socket.hpp>
#include <gamenet/protocol/ControlMessages.hpp>
#include <gamenet/protocol/FrameCodec.hpp>
#include <gamenet/protocol/Header.hpp>
#include <gamenet/protocol/MessageCodec.hpp>
#include <gamenet/protocol/PayloadBatch.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <poll.h>
#include <sys/socket.h>

namespace gamenet::test {

inline std::vector<std::byte> bytesOf(std::string_view s)
{
    std::vector<std::byte> out(s.size());
    if (!s.empty())
        std::memcpy(out.data(), s.data(), s.size());
    return out;
}

inline std::string stringOf(std::span<const std::byte> b)
{
    return std::string(reinterpret_cast<const char *>(b.data()), b.size());
}

inline crypto::Key filledKey(std::uint8_t v)
{
    crypto::Key k{};
    k.fill(static_cast<std::byte>(v));
    return k;
}

inline std::uint64_t unixNow()
{
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

/// header | plain | tag 를 만들어 봉인한다. 실패하면 빈 벡터.
inline std::vector<std::byte> buildFrame(crypto::Aead &aead, const crypto::Key &key,
                                         protocol::FrameClass cls, std::uint64_t seq,
                                         std::span<const std::byte> body)
{
    std::vector<std::byte> frame(protocol::frameSizeFor(body.size()));
    if (!body.empty())
        std::memcpy(frame.data() + protocol::kHeaderSize, body.data(), body.size());
    if (!protocol::sealFrame(aead, key, cls, seq, frame))
        frame.clear();
    return frame;
}

inline std::vector<std::byte> tokenBody(const protocol::ConnectToken &token)
{
    std::vector<std::byte> body(protocol::ConnectToken::kBodySize);
    protocol::SpanWriter w(body);
    if (!token.encode(w))
        body.clear();
    return body;
}

/// payload body: len:u16 | bytes 반복
inline std::vector<std::byte> payloadBody(const std::vector<std::string> &messages)
{
    protocol::ByteWriter w;
    for (const auto &m : messages) {
        w.writeU16Be(static_cast<std::uint16_t>(m.size()));
        w.writeBytes(bytesOf(m));
    }
    return w.release();
}

struct ReceivedFrame {
    protocol::FrameClass frameClass{};
    std::uint64_t sequence{0};
    std::vector<std::byte> body;
};

/// 서버와 마주보는 클라이언트 한 명.
class TestPeer {
  public:
    TestPeer(std::uint64_t clientId, const crypto::SecretKey &secret)
        : clientId_(clientId), secret_(secret), serverKey_(filledKey(0x11)),
          clientKey_(filledKey(0x22))
    {
    }

    /// 이미 연결된 fd 를 넘겨받는다(socketpair 등).
    void adopt(net::Socket sock) { sock_ = std::move(sock); }

    bool connect(std::uint16_t port)
    {
        sock_ = net::Socket::createTcpIPv4();
        return sock_.isValid() && sock_.connect("127.0.0.1", port) && sock_.setNoDelay(true);
    }

    void close() { sock_.close(); }

    [[nodiscard]] std::uint64_t clientId() const noexcept { return clientId_; }
    [[nodiscard]] const crypto::Key &serverKey() const noexcept { return serverKey_; }
    [[nodiscard]] const crypto::Key &clientKey() const noexcept { return clientKey_; }
    [[nodiscard]] crypto::Aead &aead() noexcept { return aead_; }

    protocol::ConnectToken makeToken(std::uint64_t seq, std::uint64_t expire) const
    {
        protocol::ConnectToken t{};
        t.protocolId = 0x0a55;
        t.version = 0x0001;
        t.expireUnixSec = expire;
        t.challengeSequence = seq;
        t.data.clientId = clientId_;
        t.data.serverKey = serverKey_;
        t.data.clientKey = clientKey_;
        return t;
    }

    std::vector<std::byte> tokenFrame(const protocol::ConnectToken &token, std::uint64_t seq)
    {
        return buildFrame(aead_, secret_.key(), protocol::FrameClass::Token, seq, tokenBody(token));
    }

    /// 핸드셰이크 이후 프레임(serverKey 로 봉인)
    std::vector<std::byte> frame(protocol::FrameClass cls, std::span<const std::byte> body)
    {
        return buildFrame(aead_, serverKey_, cls, txSeq_++, body);
    }

    std::vector<std::byte> frameAt(protocol::FrameClass cls, std::uint64_t seq,
                                   std::span<const std::byte> body)
    {
        return buildFrame(aead_, serverKey_, cls, seq, body);
    }

    bool sendRaw(std::span<const std::byte> bytes)
    {
        std::size_t off = 0;
        while (off < bytes.size()) {
            const ::ssize_t n = sock_.send(bytes.data() + off, bytes.size() - off);
            if (n < 0 && (errno == EINTR || errno == EAGAIN))
                continue;
            if (n <= 0)
                return false;
            off += static_cast<std::size_t>(n);
        }
        return !bytes.empty();
    }

    bool sendToken(std::uint64_t seq = 1) { return sendRaw(tokenFrame(makeToken(seq, unixNow() + 60), seq)); }

    bool sendPayload(const std::vector<std::string> &messages)
    {
        return sendRaw(frame(protocol::FrameClass::Payload, payloadBody(messages)));
    }

    bool sendKeepalive() { return sendRaw(frame(protocol::FrameClass::Keepalive, {})); }

    /// 최대 waitMs 동안 도착한 바이트를 모두 읽고, 완성된 프레임을 clientKey 로 연다.
    /// EOF 를 보면 peerClosed() 가 true 가 된다. 인증 실패 프레임이 있으면 false.
    bool receive(std::vector<ReceivedFrame> &out, int waitMs = 200)
    {
        ::pollfd pfd{sock_.nativeHandle(), POLLIN, 0};
        int idleWait = waitMs;
        while (!closed_ && ::poll(&pfd, 1, idleWait) > 0) {
            std::array<std::byte, 4096> buf{};
            const ::ssize_t n = sock_.recv(buf.data(), buf.size());
            if (n == 0) {
                closed_ = true;
                break;
            }
            if (n < 0)
                break;
            rx_.insert(rx_.end(), buf.begin(), buf.begin() + n);
            idleWait = 20; // 뒤따르는 조각만 잠깐 더 기다린다
        }

        for (;;) {
            protocol::Header h{};
            if (protocol::Header::parse(rx_, h) != protocol::HeaderParse::Parsed)
                return rx_.size() < protocol::kHeaderSize;
            if (rx_.size() < h.frameSize())
                return true;

            std::span<std::byte> frame(rx_.data(), h.frameSize());
            protocol::Frame f{};
            if (!protocol::openFrame(aead_, clientKey_, h, frame, f))
                return false;

            out.push_back(ReceivedFrame{f.frameClass, f.sequence,
                                        std::vector<std::byte>(f.body.begin(), f.body.end())});
            rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(h.frameSize()));
        }
    }

    [[nodiscard]] bool peerClosed() const noexcept { return closed_; }

  private:
    std::uint64_t clientId_;
    const crypto::SecretKey &secret_;
    crypto::Key serverKey_;
    crypto::Key clientKey_;
    crypto::Aead aead_;
    net::Socket sock_;
    std::uint64_t txSeq_{100};
    std::vector<std::byte> rx_;
    bool closed_{false};
};

inline std::size_t countClass(const std::vector<ReceivedFrame> &frames, protocol::FrameClass cls)
{
    std::size_t n = 0;
    for (const auto &f : frames)
        if (f.frameClass == cls)
            ++n;
    return n;
}

} // namespace gamenet::test
