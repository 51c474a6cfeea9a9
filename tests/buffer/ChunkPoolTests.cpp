#include <gamenet/buffer/Chunk.hpp>
#include <gamenet/buffer/ChunkPool.hpp>

#include <cstddef>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

using gamenet::buffer::Chunk;
using gamenet::buffer::ChunkHandle;
using gamenet::buffer::ChunkPool;

namespace {

std::vector<std::byte> pattern(std::size_t n, unsigned seed) {
    std::vector<std::byte> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::byte>((i * 31 + seed) & 0xFF);
    return v;
}

bool test_chunk_cursors() {
    Chunk c(16);
    const auto data = pattern(10, 1);

    if (c.append(data) != 10 || c.size() != 10 || c.freeSpace() != 6) {
        std::cerr << "[cursors] append bookkeeping wrong, size=" << c.size() << "\n";
        return false;
    }

    // 용량을 넘는 append 는 들어가는 만큼만 받는다.
    if (c.append(data) != 6 || c.freeSpace() != 0) {
        std::cerr << "[cursors] partial append wrong\n";
        return false;
    }

    if (c.consume(4) != 4 || c.size() != 12 || c.reclaimableSpace() != 4) {
        std::cerr << "[cursors] consume bookkeeping wrong\n";
        return false;
    }

    c.compact();
    if (c.freeSpace() != 4 || c.size() != 12) {
        std::cerr << "[cursors] compact did not reclaim head space\n";
        return false;
    }
    if (std::memcmp(c.readable().data(), data.data() + 4, 6) != 0) {
        std::cerr << "[cursors] compact moved wrong bytes\n";
        return false;
    }

    // 다 읽으면 커서가 0 으로 돌아간다.
    c.consume(100);
    if (!c.empty() || c.freeSpace() != 16) {
        std::cerr << "[cursors] drained chunk should reset cursors\n";
        return false;
    }
    return true;
}

bool test_zero_capacity_rejected() {
    try {
        Chunk c(0);
        std::cerr << "[zero] Chunk(0) should throw\n";
        return false;
    } catch (const std::invalid_argument &) {
    }

    try {
        ChunkPool pool(0);
        std::cerr << "[zero] ChunkPool(0) should throw\n";
        return false;
    } catch (const std::invalid_argument &) {
    }
    return true;
}

bool test_acquire_grows_then_reuses() {
    ChunkPool pool(64);

    ChunkHandle a = pool.acquire();
    ChunkHandle b = pool.acquire();
    if (pool.totalChunks() != 2 || pool.inUseChunks() != 2 || pool.idleChunks() != 0) {
        std::cerr << "[reuse] expected 2 fresh chunks\n";
        return false;
    }

    const auto bIndex = b.index();
    if (!pool.release(b) || b.valid()) {
        std::cerr << "[reuse] release of empty chunk should succeed and invalidate handle\n";
        return false;
    }

    // LIFO: 방금 반납한 청크가 다시 나온다.
    ChunkHandle c = pool.acquire();
    if (c.index() != bIndex || pool.totalChunks() != 2) {
        std::cerr << "[reuse] expected idle chunk to be reused\n";
        return false;
    }

    if (!pool.get(c).empty()) {
        std::cerr << "[reuse] reused chunk should be empty\n";
        return false;
    }

    return pool.release(a) && pool.release(c) && pool.idleChunks() == 2;
}

bool test_release_rejects_non_empty_and_invalid() {
    ChunkPool pool(32);
    ChunkHandle h = pool.acquire();

    const auto data = pattern(8, 7);
    (void)pool.get(h).append(data);

    if (pool.release(h)) {
        std::cerr << "[reject] release of non-empty chunk should fail\n";
        return false;
    }
    if (!h.valid()) {
        std::cerr << "[reject] handle must stay valid after rejected release\n";
        return false;
    }

    pool.get(h).consume(8);
    if (!pool.release(h)) {
        std::cerr << "[reject] drained chunk release should succeed\n";
        return false;
    }

    ChunkHandle empty;
    if (pool.release(empty)) {
        std::cerr << "[reject] invalid handle release should fail\n";
        return false;
    }
    return true;
}

bool test_handle_move_transfers_ownership() {
    ChunkPool pool(32, 1);
    ChunkHandle a = pool.acquire();
    const auto idx = a.index();

    ChunkHandle b = std::move(a);
    if (a.valid() || !b.valid() || b.index() != idx) {
        std::cerr << "[move] ownership not transferred\n";
        return false;
    }
    if (pool.totalChunks() != 1) {
        std::cerr << "[move] preallocated chunk should have been used\n";
        return false;
    }
    return pool.release(b);
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_chunk_cursors();
    ok = ok && test_zero_capacity_rejected();
    ok = ok && test_acquire_grows_then_reuses();
    ok = ok && test_release_rejects_non_empty_and_invalid();
    ok = ok && test_handle_move_transfers_ownership();

    if (!ok) {
        std::cerr << "ChunkPool tests FAILED\n";
        return 1;
    }

    std::cout << "ChunkPool tests PASSED\n";
    return 0;
}
