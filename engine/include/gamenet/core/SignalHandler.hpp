#pragma once

#include <gamenet/util/NonCopyable.hpp>

#include <array>
#include <csignal> // std::sig_atomic_t
#include <string_view>

#include <signal.h> // sigaction, SIGINT, SIGTERM

namespace gamenet::core
{

/// SIGINT/SIGTERM 을 받아 종료 플래그만 세운다. 게임 루프가 틱마다 플래그를 본다.
///
/// 프로세스 전역 상태이므로 인스턴스는 하나만 둔다.
class SignalHandler : private gamenet::util::NonMovable
{
  public:
    /// 실패 시 std::system_error.
    SignalHandler();

    /// 원래 핸들러로 복구한다. (best-effort)
    ~SignalHandler() noexcept;

    [[nodiscard]] bool isStopRequested() const noexcept;

    /// 요청이 있었다면 플래그를 내리고 true. outSignal 에 마지막 신호 번호를 준다.
    bool consumeStopRequest(int *outSignal = nullptr) noexcept;

    [[nodiscard]] static std::string_view signalName(int signo) noexcept;

  private:
    static void handleSignal(int signo) noexcept;

    static constexpr std::array<int, 2> kSignals = {SIGINT, SIGTERM};

    std::array<struct sigaction, kSignals.size()> oldActions_{};
    bool installed_{false};

    void uninstall() noexcept;
};

} // namespace gamenet::core
