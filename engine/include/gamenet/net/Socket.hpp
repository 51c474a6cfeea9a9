#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/socket.h> // sockaddr, socklen_t
#include <sys/types.h>  // ssize_t

#include <gamenet/buffer/ByteStream.hpp>
#include <gamenet/util/NonCopyable.hpp>

namespace gamenet::net {

/// POSIX 소켓 fd 를 RAII 로 감싸는 얇은 래퍼입니다.
///
/// - move-only. fd 소유권은 항상 정확히 한 Socket 에만 있다.
/// - Buffer 가 직접 읽고 쓸 수 있도록 IByteSource / IByteSink 를 구현한다.
/// - 연결 상태나 프로토콜은 모른다. 순수한 OS 레벨 래퍼다.
class Socket final : public buffer::IByteSource,
                     public buffer::IByteSink,
                     private gamenet::util::NonCopyable {
  public:
    using Handle = int;

    Socket() noexcept = default;

    /// 이미 만들어진 fd 의 소유권을 넘겨받는다.
    explicit Socket(Handle fd) noexcept;

    ~Socket() noexcept override;

    Socket(Socket &&other) noexcept;
    Socket &operator=(Socket &&other) noexcept;

    [[nodiscard]] bool isValid() const noexcept { return fd_ >= 0; }
    [[nodiscard]] Handle nativeHandle() const noexcept { return fd_; }

    /// TCP/IPv4 스트림 소켓 (CLOEXEC). 실패 시 isValid() == false.
    [[nodiscard]] static Socket createTcpIPv4() noexcept;

    /// idempotent
    void close() noexcept;

    [[nodiscard]] bool setNonBlocking(bool enable) noexcept;
    [[nodiscard]] bool setReuseAddr(bool enable) noexcept;

    /// TCP_NODELAY. 틱 단위로 작은 패킷을 보내므로 Nagle 은 끈다.
    [[nodiscard]] bool setNoDelay(bool enable) noexcept;

    /// IPv4 문자열 주소/포트로 bind 합니다. (예: "0.0.0.0", 7777)
    [[nodiscard]] bool bind(const std::string &ip, std::uint16_t port) noexcept;

    [[nodiscard]] bool listen(int backlog) noexcept;

    /// accept4(NONBLOCK|CLOEXEC). 실패 시 isValid()==false 인 Socket 을 반환하고 errno 를 남긴다.
    [[nodiscard]] Socket accept() noexcept;

    [[nodiscard]] bool connect(const std::string &ip, std::uint16_t port) noexcept;

    /// getsockname 으로 얻은 로컬 포트. 실패 시 0.
    [[nodiscard]] std::uint16_t localPort() const noexcept;

    /// send(2) 래퍼. 끊긴 상대에게 써도 SIGPIPE 가 나지 않도록 MSG_NOSIGNAL 을 붙인다.
    [[nodiscard]] ::ssize_t send(const void *data, std::size_t len) noexcept;

    /// recv(2) 래퍼. 반환값 의미는 recv(2) 와 같다.
    [[nodiscard]] ::ssize_t recv(void *buffer, std::size_t len) noexcept;

    // ---- buffer::IByteSource / IByteSink ----
    [[nodiscard]] ::ssize_t readSome(std::byte *dst, std::size_t len) noexcept override
    {
        return recv(dst, len);
    }
    [[nodiscard]] ::ssize_t writeSome(const std::byte *src, std::size_t len) noexcept override
    {
        return send(src, len);
    }

  private:
    Handle fd_{-1};
};

} // namespace gamenet::net
