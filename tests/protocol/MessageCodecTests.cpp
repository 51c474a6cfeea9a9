#include <gamenet/protocol/MessageCodec.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <span>
#include <vector>

namespace {

using gamenet::protocol::ByteReader;
using gamenet::protocol::ByteWriter;
using gamenet::protocol::SpanWriter;

// 예제 메시지: 8 + 16 + 64 bit
struct StateMsg {
    std::uint8_t kind{0};
    std::uint16_t entity{0};
    std::uint64_t tick{0};

    bool operator==(const StateMsg &o) const noexcept = default;
};

std::vector<std::byte> encodeState(const StateMsg &m) {
    ByteWriter w;
    w.writeU8(m.kind);
    w.writeU16Be(m.entity);
    w.writeU64Be(m.tick);
    return w.release();
}

bool decodeState(std::span<const std::byte> bytes, StateMsg &out) {
    ByteReader r(bytes);
    if (!r.readU8(out.kind) || !r.readU16Be(out.entity) || !r.readU64Be(out.tick)) {
        return false;
    }
    // "정확히 소비"를 규약으로 고정(남는 바이트가 있으면 다른 메시지와 경계가 흐려짐)
    return r.atEnd();
}

std::uint8_t u8(std::byte b) { return std::to_integer<std::uint8_t>(b); }

bool test_big_endian_layout() {
    const StateMsg in{0x7F, 0x1122, 0x0102030405060708ull};
    const auto bytes = encodeState(in);

    // expected: 7F | 11 22 | 01 02 03 04 05 06 07 08
    if (bytes.size() != 11 || u8(bytes[0]) != 0x7F || u8(bytes[1]) != 0x11 ||
        u8(bytes[2]) != 0x22) {
        std::cerr << "[layout] header bytes mismatch\n";
        return false;
    }
    for (std::size_t i = 0; i < 8; ++i) {
        if (u8(bytes[3 + i]) != static_cast<std::uint8_t>(i + 1)) {
            std::cerr << "[layout] u64 byte mismatch at i=" << i << "\n";
            return false;
        }
    }

    StateMsg out{};
    return decodeState(bytes, out) && out == in;
}

bool test_truncated_and_trailing_rejected() {
    auto bytes = encodeState(StateMsg{1, 2, 3});

    StateMsg out{};
    bytes.push_back(std::byte{0});
    if (decodeState(bytes, out)) {
        std::cerr << "[bounds] trailing byte accepted\n";
        return false;
    }

    bytes.resize(bytes.size() - 2);
    if (decodeState(bytes, out)) {
        std::cerr << "[bounds] truncated message accepted\n";
        return false;
    }
    return true;
}

bool test_span_writer_is_all_or_nothing() {
    std::array<std::byte, 10> area{};
    SpanWriter w(area);

    if (!w.writeU64Be(42) || w.offset() != 8) {
        std::cerr << "[span] u64 write failed\n";
        return false;
    }

    // 남은 2바이트에 8바이트는 못 쓴다. 오프셋도 그대로여야 한다.
    if (w.writeU64Be(7) || w.offset() != 8) {
        std::cerr << "[span] overflowing write should fail without side effects\n";
        return false;
    }

    const std::array<std::byte, 3> three{};
    if (w.writeBytes(three) || !w.writeU16Be(0xBEEF) || w.remaining() != 0) {
        std::cerr << "[span] remaining space bookkeeping wrong\n";
        return false;
    }
    return u8(area[8]) == 0xBE && u8(area[9]) == 0xEF && !w.writeU8(1);
}

bool test_reader_view_is_zero_copy() {
    ByteWriter w;
    w.writeU16Be(3);
    const std::array<std::byte, 3> payload{std::byte{'a'}, std::byte{'b'}, std::byte{'c'}};
    w.writeBytes(payload);

    const auto data = w.view();
    ByteReader r(data);
    std::uint16_t len = 0;
    std::span<const std::byte> view;
    if (!r.readU16Be(len) || !r.readBytesView(len, view) || !r.atEnd()) {
        std::cerr << "[view] read failed\n";
        return false;
    }
    return view.data() == data.data() + 2 && view.size() == 3 && !r.readBytesView(1, view);
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_big_endian_layout();
    ok = ok && test_truncated_and_trailing_rejected();
    ok = ok && test_span_writer_is_all_or_nothing();
    ok = ok && test_reader_view_is_zero_copy();

    if (!ok) {
        std::cerr << "MessageCodec tests FAILED\n";
        return 1;
    }

    std::cout << "MessageCodec tests PASSED\n";
    return 0;
}
