#pragma once

#include <cstdint>
#include <limits>
#include <optional>

namespace gamenet::protocol
{

/// 수신 방향 anti-replay 검사기.
///
/// - 첫 sequence 는 무조건 받는다.
/// - 이후에는 마지막으로 받은 값보다 엄격히 커야 한다.
/// - 예외: 마지막 값이 u64 최대값이면 0 은 wraparound 로 보고 받는다.
///
/// 인증(복호화)에 성공한 프레임에만 accept() 를 호출해야 한다.
class ReplayGuard
{
  public:
    /// 통과하면 last 를 갱신하고 true. 거부 시 상태는 바뀌지 않는다.
    [[nodiscard]] bool accept(std::uint64_t sequence) noexcept
    {
        if (last_ && !isNewer_(*last_, sequence))
        {
            return false;
        }
        last_ = sequence;
        return true;
    }

    /// 키가 바뀌는 시점(핸드셰이크 완료)에 sequence 공간을 새로 시작한다.
    void reset() noexcept { last_.reset(); }

    [[nodiscard]] std::optional<std::uint64_t> last() const noexcept { return last_; }

  private:
    static bool isNewer_(std::uint64_t last, std::uint64_t candidate) noexcept
    {
        if (candidate > last)
            return true;
        return last == std::numeric_limits<std::uint64_t>::max() && candidate == 0;
    }

    std::optional<std::uint64_t> last_;
};

} // namespace gamenet::protocol
