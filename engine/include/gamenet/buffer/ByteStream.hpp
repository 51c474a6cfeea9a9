#pragma once

#include <cstddef>
#include <cstdint>

#include <sys/types.h> // ssize_t

namespace gamenet::buffer {

/// Buffer::readFrom 이 바이트를 끌어오는 원천입니다.
///
/// 반환값 규약은 recv(2) 와 같다.
/// - > 0 : 읽은 바이트 수
/// - 0   : 상대가 닫음(EOF)
/// - -1  : errno 설정 (EAGAIN/EWOULDBLOCK 이면 "지금은 없음")
class IByteSource {
  public:
    virtual ~IByteSource() = default;
    [[nodiscard]] virtual ::ssize_t readSome(std::byte *dst, std::size_t len) noexcept = 0;
};

/// Buffer::writeTo 가 바이트를 밀어내는 대상입니다. 반환값 규약은 send(2) 와 같다.
class IByteSink {
  public:
    virtual ~IByteSink() = default;
    [[nodiscard]] virtual ::ssize_t writeSome(const std::byte *src, std::size_t len) noexcept = 0;
};

enum class IoStatus : std::uint8_t {
    Progress,   ///< 1바이트 이상 진행했거나, 할 일이 없었음
    WouldBlock, ///< 아무것도 못 하고 EAGAIN
    Failed,     ///< 치명적 I/O 오류
};

/// EOF 는 오류가 아니다. 같은 호출에서 읽은 바이트는 그대로 버퍼에 남고 eof 만 켜진다.
struct IoResult {
    IoStatus status{IoStatus::Progress};
    std::size_t bytes{0};
    int error{0};     ///< Failed 일 때 errno
    bool eof{false};  ///< 상대가 송신 방향을 닫음. 더 읽을 것이 없다

    [[nodiscard]] bool failed() const noexcept { return status == IoStatus::Failed; }
    [[nodiscard]] bool peerClosed() const noexcept { return eof; }
};

} // namespace gamenet::buffer
