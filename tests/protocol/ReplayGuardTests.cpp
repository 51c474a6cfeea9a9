#include <gamenet/protocol/ReplayGuard.hpp>

#include <cstdint>
#include <iostream>
#include <limits>

using gamenet::protocol::ReplayGuard;

namespace {

constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();

bool test_first_sequence_always_accepted() {
    ReplayGuard a;
    ReplayGuard b;
    if (!a.accept(0) || !b.accept(kMax)) {
        std::cerr << "[first] first sequence must be accepted\n";
        return false;
    }
    return a.last() == 0u && b.last() == kMax;
}

bool test_strictly_increasing() {
    ReplayGuard g;
    if (!g.accept(10) || !g.accept(11) || !g.accept(500)) {
        std::cerr << "[inc] increasing sequences should pass\n";
        return false;
    }
    if (g.accept(500) || g.accept(499) || g.accept(0)) {
        std::cerr << "[inc] equal or older sequences should be rejected\n";
        return false;
    }
    // 거부는 상태를 바꾸지 않는다.
    return g.last() == 500u && g.accept(501);
}

bool test_wraparound_at_max() {
    ReplayGuard g;
    if (!g.accept(kMax - 1) || !g.accept(kMax)) {
        std::cerr << "[wrap] approach to max failed\n";
        return false;
    }
    if (!g.accept(0)) {
        std::cerr << "[wrap] 0 after max should be accepted\n";
        return false;
    }
    if (g.accept(kMax) || g.accept(0)) {
        std::cerr << "[wrap] replay after wrap should be rejected\n";
        return false;
    }
    return g.accept(1);
}

bool test_zero_only_wraps_from_max() {
    ReplayGuard g;
    (void)g.accept(kMax - 1);
    if (g.accept(0)) {
        std::cerr << "[wrap] 0 after max-1 must be rejected\n";
        return false;
    }
    return true;
}

bool test_reset_starts_over() {
    ReplayGuard g;
    (void)g.accept(1000);
    g.reset();
    if (g.last().has_value() || !g.accept(3)) {
        std::cerr << "[reset] reset should forget last sequence\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_first_sequence_always_accepted();
    ok = ok && test_strictly_increasing();
    ok = ok && test_wraparound_at_max();
    ok = ok && test_zero_only_wraps_from_max();
    ok = ok && test_reset_starts_over();

    if (!ok) {
        std::cerr << "ReplayGuard tests FAILED\n";
        return 1;
    }

    std::cout << "ReplayGuard tests PASSED\n";
    return 0;
}
