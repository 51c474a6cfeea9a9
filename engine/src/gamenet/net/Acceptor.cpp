#include <gamenet/net/Acceptor.hpp>

#include <gamenet/core/Logger.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <system_error>
#include <utility>

namespace gamenet::net
{

namespace
{
[[noreturn]] void throwSysError(const char *what)
{
    const int e = errno;
    SLOG_ERROR("Acceptor", "SetupFailed", "what='{}' errno={} msg='{}'", what, e, std::strerror(e));
    throw std::system_error(e, std::generic_category(), what);
}
} // namespace

Acceptor::Acceptor(std::string listenAddress, std::uint16_t listenPort, int backlog)
    : listenAddress_(std::move(listenAddress)), listenPort_(listenPort)
{
    listenSocket_ = Socket::createTcpIPv4();
    if (!listenSocket_.isValid())
    {
        throwSysError("Acceptor: socket(AF_INET, SOCK_STREAM) failed");
    }
    if (!listenSocket_.setReuseAddr(true))
    {
        throwSysError("Acceptor: setsockopt(SO_REUSEADDR) failed");
    }
    if (!listenSocket_.bind(listenAddress_, listenPort_))
    {
        throwSysError("Acceptor: bind() failed");
    }
    if (!listenSocket_.listen(backlog))
    {
        throwSysError("Acceptor: listen() failed");
    }
    if (!listenSocket_.setNonBlocking(true))
    {
        throwSysError("Acceptor: fcntl(O_NONBLOCK) failed");
    }

    listenPort_ = listenSocket_.localPort();

    SLOG_INFO("Acceptor", "Listening", "addr={} port={} backlog={}", listenAddress_, listenPort_,
              backlog);
}

Socket Acceptor::acceptOne_(PeerEndpoint &peer) noexcept
{
    ::sockaddr_in addr{};
    ::socklen_t len = sizeof(addr);

    const int fd = ::accept4(listenSocket_.nativeHandle(), reinterpret_cast<::sockaddr *>(&addr),
                             &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0)
    {
        return Socket{};
    }

    char buf[INET_ADDRSTRLEN] = {};
    peer.ip = (::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf)) != nullptr) ? buf : "unknown";
    peer.port = ntohs(addr.sin_port);
    return Socket{fd};
}

std::size_t Acceptor::acceptPending(const AcceptCallback &onAccept)
{
    std::size_t accepted = 0;

    while (listenSocket_.isValid())
    {
        PeerEndpoint peer{};
        Socket client = acceptOne_(peer);

        if (!client.isValid())
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED)
            {
                continue;
            }

            // EMFILE/ENFILE 등: 이번 틱은 포기하고 다음 poll 에서 다시 시도한다.
            SLOG_ERROR("Acceptor", "AcceptFailed", "errno={} msg='{}'", errno,
                       std::strerror(errno));
            break;
        }

        if (!client.setNoDelay(true))
        {
            SLOG_WARN("Acceptor", "NoDelayFailed", "fd={} errno={}", client.nativeHandle(), errno);
        }

        SLOG_DEBUG("Acceptor", "Accepted", "peer_ip={} peer_port={} fd={}", peer.ip, peer.port,
                   client.nativeHandle());

        ++accepted;
        onAccept(std::move(client), peer);
    }

    return accepted;
}

} // namespace gamenet::net
