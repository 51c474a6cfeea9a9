#include <gamenet/net/Socket.hpp>

#include <arpa/inet.h>   // inet_pton
#include <cerrno>        // errno
#include <fcntl.h>       // fcntl, O_NONBLOCK
#include <netinet/in.h>  // sockaddr_in
#include <netinet/tcp.h> // TCP_NODELAY
#include <unistd.h>      // close

namespace gamenet::net
{

namespace
{
bool makeAddress(const std::string &ip, std::uint16_t port, ::sockaddr_in &addr) noexcept
{
    addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    // inet_pton 은 성공 시 1, 실패 시 0 또는 -1
    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
    {
        errno = EINVAL;
        return false;
    }
    return true;
}
} // namespace

Socket::Socket(Handle fd) noexcept : fd_(fd) {}

Socket::~Socket() noexcept
{
    close();
}

Socket::Socket(Socket &&other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

Socket &Socket::operator=(Socket &&other) noexcept
{
    if (this != &other)
    {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Socket Socket::createTcpIPv4() noexcept
{
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        return Socket{};
    }
    return Socket{fd};
}

void Socket::close() noexcept
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

bool Socket::setNonBlocking(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags == -1)
    {
        return false;
    }

    const int newFlags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd_, F_SETFL, newFlags) != -1;
}

bool Socket::setReuseAddr(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int opt = enable ? 1 : 0;
    return ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != -1;
}

bool Socket::setNoDelay(bool enable) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    const int opt = enable ? 1 : 0;
    return ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) != -1;
}

bool Socket::bind(const std::string &ip, std::uint16_t port) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    ::sockaddr_in addr{};
    if (!makeAddress(ip, port, addr))
    {
        return false;
    }
    return ::bind(fd_, reinterpret_cast<::sockaddr *>(&addr), sizeof(addr)) != -1;
}

bool Socket::listen(int backlog) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }
    return ::listen(fd_, backlog) != -1;
}

Socket Socket::accept() noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return Socket{};
    }

    const int newFd = ::accept4(fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (newFd < 0)
    {
        return Socket{};
    }
    return Socket{newFd};
}

bool Socket::connect(const std::string &ip, std::uint16_t port) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return false;
    }

    ::sockaddr_in addr{};
    if (!makeAddress(ip, port, addr))
    {
        return false;
    }
    return ::connect(fd_, reinterpret_cast<::sockaddr *>(&addr), sizeof(addr)) != -1;
}

std::uint16_t Socket::localPort() const noexcept
{
    ::sockaddr_in addr{};
    ::socklen_t len = sizeof(addr);
    if (!isValid() || ::getsockname(fd_, reinterpret_cast<::sockaddr *>(&addr), &len) == -1)
    {
        return 0;
    }
    return ntohs(addr.sin_port);
}

::ssize_t Socket::send(const void *data, std::size_t len) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }
    return ::send(fd_, data, len, MSG_NOSIGNAL);
}

::ssize_t Socket::recv(void *buffer, std::size_t len) noexcept
{
    if (!isValid())
    {
        errno = EBADF;
        return -1;
    }
    return ::recv(fd_, buffer, len, 0);
}

} // namespace gamenet::net
