#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <gamenet/net/Socket.hpp>
#include <gamenet/util/NonCopyable.hpp>

namespace gamenet::net {

/// 논블로킹 TCP 리스닝 소켓을 소유합니다.
///
/// - 생성자에서 socket/bind/listen 까지 끝낸다. 실패하면 std::system_error.
/// - 리스닝 fd 는 Endpoint 가 EpollReactor 에 등록하고, 읽기 이벤트가 오면 acceptPending() 을 부른다.
class Acceptor final : private gamenet::util::NonCopyable {
  public:
    struct PeerEndpoint {
        std::string ip;
        std::uint16_t port{0};
    };

    using AcceptCallback = std::function<void(Socket &&client, const PeerEndpoint &peer)>;

    /// @param listenPort 0 이면 커널이 고른 포트를 listenPort() 로 돌려준다.
    Acceptor(std::string listenAddress, std::uint16_t listenPort, int backlog);

    /// EAGAIN 이 날 때까지 accept 하며 연결마다 onAccept 를 부른다. 수락한 개수를 돌려준다.
    ///
    /// 새 소켓은 이미 논블로킹이고 TCP_NODELAY 가 켜져 있다.
    std::size_t acceptPending(const AcceptCallback &onAccept);

    void close() noexcept { listenSocket_.close(); }
    [[nodiscard]] bool isValid() const noexcept { return listenSocket_.isValid(); }

    [[nodiscard]] std::string_view listenAddress() const noexcept { return listenAddress_; }
    [[nodiscard]] std::uint16_t listenPort() const noexcept { return listenPort_; }
    [[nodiscard]] int nativeHandle() const noexcept { return listenSocket_.nativeHandle(); }

  private:
    Socket acceptOne_(PeerEndpoint &peer) noexcept;

    Socket listenSocket_;
    std::string listenAddress_;
    std::uint16_t listenPort_{0};
};

} // namespace gamenet::net
