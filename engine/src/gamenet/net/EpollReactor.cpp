#include <gamenet/net/EpollReactor.hpp>

#include <gamenet/core/Logger.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <unistd.h>

namespace gamenet::net
{

EpollReactor::EpollReactor(int maxEvents)
{
    if (maxEvents <= 0)
    {
        maxEvents = 64;
    }

    epollFd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                "EpollReactor: epoll_create1 failed");
    }

    eventBuffer_.resize(static_cast<std::size_t>(maxEvents));
    ready_.reserve(static_cast<std::size_t>(maxEvents));

    SLOG_DEBUG("EpollReactor", "Created", "fd={} max_events={}", epollFd_, maxEvents);
}

EpollReactor::~EpollReactor() noexcept
{
    if (epollFd_ >= 0)
    {
        ::close(epollFd_);
        epollFd_ = -1;
    }
}

bool EpollReactor::control_(int op, Fd fd, std::uint64_t token, std::uint32_t events) noexcept
{
    if (epollFd_ < 0 || fd < 0)
    {
        errno = EBADF;
        SLOG_ERROR("EpollReactor", "CtlFailed", "reason=InvalidFd epoll_fd={} fd={}", epollFd_, fd);
        return false;
    }

    ::epoll_event ev{};
    ev.events = events;
    ev.data.u64 = token;

    if (::epoll_ctl(epollFd_, op, fd, &ev) == -1)
    {
        SLOG_ERROR("EpollReactor", "CtlFailed", "op={} fd={} errno={} msg='{}'", op, fd, errno,
                   std::strerror(errno));
        return false;
    }
    return true;
}

bool EpollReactor::registerFd(Fd fd, std::uint64_t token, std::uint32_t events) noexcept
{
    if (!control_(EPOLL_CTL_ADD, fd, token, events))
        return false;
    SLOG_TRACE("EpollReactor", "Registered", "fd={} token={} events=0x{:x}", fd, token, events);
    return true;
}

bool EpollReactor::modifyFd(Fd fd, std::uint64_t token, std::uint32_t events) noexcept
{
    return control_(EPOLL_CTL_MOD, fd, token, events);
}

bool EpollReactor::unregisterFd(Fd fd) noexcept
{
    if (epollFd_ < 0 || fd < 0)
    {
        errno = EBADF;
        return false;
    }

    if (::epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr) == -1)
    {
        SLOG_WARN("EpollReactor", "CtlDelFailed", "fd={} errno={} msg='{}'", fd, errno,
                  std::strerror(errno));
        return false;
    }
    return true;
}

std::span<const EpollReactor::ReadyEvent> EpollReactor::wait(int timeoutMs) noexcept
{
    ready_.clear();

    const int n = ::epoll_wait(epollFd_, eventBuffer_.data(),
                               static_cast<int>(eventBuffer_.size()), timeoutMs);
    if (n < 0)
    {
        if (errno != EINTR)
        {
            SLOG_ERROR("EpollReactor", "WaitFailed", "errno={} msg='{}'", errno,
                       std::strerror(errno));
        }
        return {};
    }

    for (int i = 0; i < n; ++i)
    {
        const auto &ev = eventBuffer_[static_cast<std::size_t>(i)];
        ready_.push_back(ReadyEvent{ev.data.u64, ev.events});
    }
    return ready_;
}

} // namespace gamenet::net
