#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>
#include <vector>

#include <sys/epoll.h>

#include <gamenet/util/NonCopyable.hpp>

namespace gamenet::net
{

/// epoll 인스턴스 하나를 감싼다. fd 마다 u64 token 을 붙여 등록하고, 이벤트는 token 으로 돌려준다.
///
/// Endpoint 는 token 에 채널 슬롯 번호를 넣어 fd -> 채널 조회 없이 바로 분기한다.
class EpollReactor : private gamenet::util::NonMovable
{
  public:
    using Fd = int;

    enum class Event : std::uint32_t
    {
        None = 0,
        Read = EPOLLIN,
        Write = EPOLLOUT,
        ReadHangup = EPOLLRDHUP,
        Error = EPOLLERR,
        Hangup = EPOLLHUP,
    };

    struct ReadyEvent
    {
        std::uint64_t token{0};
        std::uint32_t events{0}; ///< EPOLLIN | EPOLLOUT | ... 의 비트 OR
    };

    /// @param maxEvents wait() 한 번에 받을 최대 이벤트 수. epoll 생성 실패 시 std::system_error.
    explicit EpollReactor(int maxEvents);
    ~EpollReactor() noexcept;

    static constexpr std::uint32_t makeEventMask(std::initializer_list<Event> events) noexcept
    {
        std::uint32_t mask = 0;
        for (auto e : events)
        {
            mask |= static_cast<std::uint32_t>(e);
        }
        return mask;
    }

    [[nodiscard]] bool registerFd(Fd fd, std::uint64_t token, std::uint32_t events) noexcept;
    [[nodiscard]] bool modifyFd(Fd fd, std::uint64_t token, std::uint32_t events) noexcept;
    bool unregisterFd(Fd fd) noexcept;

    /// 준비된 이벤트를 내부 버퍼에 받아 view 로 돌려준다. 다음 wait() 전까지 유효하다.
    ///
    /// timeoutMs 0 이면 즉시 리턴(폴링). EINTR 은 이벤트 0개로 취급한다.
    /// 그 밖의 오류는 빈 span 과 함께 ERROR 로그를 남긴다.
    [[nodiscard]] std::span<const ReadyEvent> wait(int timeoutMs) noexcept;

    [[nodiscard]] Fd nativeHandle() const noexcept { return epollFd_; }

  private:
    bool control_(int op, Fd fd, std::uint64_t token, std::uint32_t events) noexcept;

    Fd epollFd_{-1};
    std::vector<::epoll_event> eventBuffer_;
    std::vector<ReadyEvent> ready_;
};

} // namespace gamenet::net
