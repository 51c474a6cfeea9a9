#include <gamenet/buffer/Buffer.hpp>
#include <gamenet/buffer/ChunkPool.hpp>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <vector>

using gamenet::buffer::Buffer;
using gamenet::buffer::ChunkPool;
using gamenet::buffer::IByteSink;
using gamenet::buffer::IByteSource;
using gamenet::buffer::IoStatus;

namespace {

std::vector<std::byte> pattern(std::size_t n, unsigned seed) {
    std::vector<std::byte> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::byte>((i * 131 + seed) & 0xFF);
    return v;
}

/// 결정적인 의사 난수 (테스트 재현성)
class Lcg {
  public:
    explicit Lcg(std::uint32_t seed) : state_(seed) {}
    std::uint32_t next() {
        state_ = state_ * 1664525u + 1013904223u;
        return state_ >> 8;
    }

  private:
    std::uint32_t state_;
};

/// 임의 크기로 끊어 주고, 가끔 EAGAIN 을 내는 원천
class FlakySource final : public IByteSource {
  public:
    FlakySource(std::vector<std::byte> data, std::uint32_t seed)
        : data_(std::move(data)), rng_(seed) {}

    ::ssize_t readSome(std::byte *dst, std::size_t len) noexcept override {
        if (pos_ == data_.size() || rng_.next() % 4 == 0) {
            errno = EAGAIN;
            return -1;
        }
        std::size_t n = 1 + rng_.next() % 700;
        n = std::min({n, len, data_.size() - pos_});
        std::memcpy(dst, data_.data() + pos_, n);
        pos_ += n;
        return static_cast<::ssize_t>(n);
    }

    [[nodiscard]] bool drained() const { return pos_ == data_.size(); }

  private:
    std::vector<std::byte> data_;
    std::size_t pos_{0};
    Lcg rng_;
};

/// 임의 크기만 받아 주고, 가끔 EAGAIN 을 내는 대상
class FlakySink final : public IByteSink {
  public:
    explicit FlakySink(std::uint32_t seed) : rng_(seed) {}

    ::ssize_t writeSome(const std::byte *src, std::size_t len) noexcept override {
        if (rng_.next() % 3 == 0) {
            errno = EAGAIN;
            return -1;
        }
        const std::size_t n = std::min<std::size_t>(len, 1 + rng_.next() % 500);
        out.insert(out.end(), src, src + n);
        return static_cast<::ssize_t>(n);
    }

    std::vector<std::byte> out;

  private:
    Lcg rng_;
};

class EofSource final : public IByteSource {
  public:
    ::ssize_t readSome(std::byte *dst, std::size_t len) noexcept override {
        if (sent_ || len == 0)
            return 0;
        sent_ = true;
        dst[0] = std::byte{0x42};
        return 1;
    }

  private:
    bool sent_{false};
};

bool test_chunks_follow_write_and_read() {
    constexpr std::size_t C = 128;
    ChunkPool pool(C);
    Buffer buf(pool);

    const auto data = pattern(3 * C + 1, 3);
    buf.write(data);

    if (pool.totalChunks() != 4 || buf.chunkCount() != 4 || buf.size() == 0) {
        std::cerr << "[chunks] expected 4 chunks after 3C+1 bytes, total=" << pool.totalChunks()
                  << "\n";
        return false;
    }

    std::vector<std::byte> dst(3 * C);
    if (buf.read(dst) != 3 * C || !std::equal(dst.begin(), dst.end(), data.begin())) {
        std::cerr << "[chunks] read mismatch\n";
        return false;
    }

    if (pool.idleChunks() != 3 || buf.chunkCount() != 1 || buf.size() != 1) {
        std::cerr << "[chunks] expected 3 idle chunks and 1 held, idle=" << pool.idleChunks()
                  << " held=" << buf.chunkCount() << "\n";
        return false;
    }

    std::byte last{};
    if (buf.read({&last, 1}) != 1 || last != data.back() || !buf.empty()) {
        std::cerr << "[chunks] last byte mismatch\n";
        return false;
    }

    // 빈 버퍼도 청크 하나는 들고 있다.
    return buf.chunkCount() == 1 && pool.inUseChunks() == 1;
}

bool test_flaky_round_trip() {
    constexpr std::size_t C = 256;
    constexpr std::size_t kHighWater = 4 * C;

    ChunkPool pool(C);
    const auto data = pattern(64 * 1024, 11);

    FlakySource source(data, 7);
    FlakySink sink(13);

    {
        Buffer buf(pool);
        std::size_t peak = 0;

        for (int round = 0; round < 100000 && sink.out.size() < data.size(); ++round) {
            if (buf.size() < kHighWater) {
                const auto r = buf.readFrom(source, kHighWater - buf.size());
                if (r.failed()) {
                    std::cerr << "[flaky] unexpected read failure\n";
                    return false;
                }
            }
            peak = std::max(peak, buf.size());

            const auto w = buf.writeTo(sink);
            if (w.failed()) {
                std::cerr << "[flaky] unexpected write failure\n";
                return false;
            }
        }

        if (!source.drained() || sink.out != data) {
            std::cerr << "[flaky] byte stream mismatch, got=" << sink.out.size() << "\n";
            return false;
        }

        if (peak > kHighWater) {
            std::cerr << "[flaky] buffer exceeded high-water mark, peak=" << peak << "\n";
            return false;
        }
    }

    // 청크 수는 high-water 분량 + 경계 여유를 넘지 않는다.
    if (pool.totalChunks() > kHighWater / C + 2) {
        std::cerr << "[flaky] too many chunks allocated, total=" << pool.totalChunks() << "\n";
        return false;
    }
    if (pool.inUseChunks() != 0) {
        std::cerr << "[flaky] chunks leaked after buffer destruction\n";
        return false;
    }
    return true;
}

bool test_contiguous_across_boundary() {
    constexpr std::size_t C = 64;
    ChunkPool pool(C);
    Buffer buf(pool);

    const auto data = pattern(C + 40, 5);
    buf.write(data);

    // 앞쪽 50 바이트를 소비해서 레코드가 경계에 걸치게 만든다.
    buf.consume(50);

    auto view = buf.contiguous(40);
    if (view.size() != 40 || !std::equal(view.begin(), view.end(), data.begin() + 50)) {
        std::cerr << "[contig] gathered bytes mismatch\n";
        return false;
    }

    // 이미 연속이면 같은 view 를 다시 준다.
    auto again = buf.contiguous(40);
    if (again.data() != view.data()) {
        std::cerr << "[contig] second call should not copy\n";
        return false;
    }

    if (!buf.contiguous(C + 1).empty() || !buf.contiguous(buf.size() + 1).empty()) {
        std::cerr << "[contig] oversize request should yield empty span\n";
        return false;
    }

    buf.consume(buf.size());
    return buf.empty() && buf.chunkCount() == 1;
}

bool test_reserve_commit() {
    constexpr std::size_t C = 32;
    ChunkPool pool(C);
    Buffer buf(pool);

    buf.write(pattern(20, 1));

    // back 에 남은 12 바이트로는 부족하다: 새 청크에서 연속 공간을 받는다.
    auto space = buf.reserve(16);
    if (space.size() != 16 || buf.chunkCount() != 2) {
        std::cerr << "[reserve] expected fresh chunk for 16 bytes\n";
        return false;
    }
    std::memset(space.data(), 0x7A, 10);
    buf.commit(10);

    if (buf.size() != 30) {
        std::cerr << "[reserve] size after commit=" << buf.size() << "\n";
        return false;
    }

    if (!buf.reserve(C + 1).empty()) {
        std::cerr << "[reserve] larger than chunk should fail\n";
        return false;
    }

    buf.consume(20);
    auto tail = buf.readUpto(100);
    return tail.size() == 10 && tail[0] == std::byte{0x7A};
}

bool test_read_from_eof() {
    ChunkPool pool(16);
    Buffer buf(pool);
    EofSource source;

    const auto r = buf.readFrom(source);
    if (r.failed() || r.status != IoStatus::Progress || !r.peerClosed() || r.bytes != 1) {
        std::cerr << "[eof] expected Progress with eof after 1 byte\n";
        return false;
    }
    if (buf.size() != 1) {
        std::cerr << "[eof] byte before EOF should be kept\n";
        return false;
    }

    buf.clear();
    if (!buf.empty() || buf.chunkCount() != 1)
        return false;

    // 바이트 없이 바로 EOF
    const auto again = buf.readFrom(source);
    if (again.failed() || again.status != IoStatus::WouldBlock || !again.peerClosed() ||
        again.bytes != 0) {
        std::cerr << "[eof] bare EOF should be WouldBlock with eof\n";
        return false;
    }
    return buf.empty();
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_chunks_follow_write_and_read();
    ok = ok && test_flaky_round_trip();
    ok = ok && test_contiguous_across_boundary();
    ok = ok && test_reserve_commit();
    ok = ok && test_read_from_eof();

    if (!ok) {
        std::cerr << "Buffer tests FAILED\n";
        return 1;
    }

    std::cout << "Buffer tests PASSED\n";
    return 0;
}
