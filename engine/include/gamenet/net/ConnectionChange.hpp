#pragma once

#include <cstdint>

#include <gamenet/protocol/ControlMessages.hpp>

namespace gamenet::net
{

/// Endpoint 안의 채널 슬롯 번호. 끊긴 뒤에는 다른 연결에 재사용될 수 있다.
using ChannelId = std::uint32_t;

/// 토큰이 인증한 클라이언트 식별자
using ClientId = std::uint64_t;

/// 연결 수명 이벤트. Endpoint::changes() 로만 전달된다.
///
/// 핸드셰이크를 마친 채널마다 Connected 가 정확히 한 번,
/// 해제된 채널마다 Disconnected 가 정확히 한 번 나온다.
/// 핸드셰이크 전에 끊긴 채널은 Disconnected 만 나온다(clientId == 0).
struct ConnectionChange
{
    enum class Kind : std::uint8_t
    {
        Connected,
        Disconnected,
    };

    Kind kind{Kind::Connected};
    ChannelId channel{0};
    ClientId clientId{0};
    protocol::DisconnectReason reason{protocol::DisconnectReason::Requested};

    [[nodiscard]] static ConnectionChange connected(ChannelId channel, ClientId client) noexcept
    {
        return ConnectionChange{Kind::Connected, channel, client, protocol::DisconnectReason::Requested};
    }

    [[nodiscard]] static ConnectionChange disconnected(ChannelId channel, ClientId client,
                                                       protocol::DisconnectReason reason) noexcept
    {
        return ConnectionChange{Kind::Disconnected, channel, client, reason};
    }

    bool operator==(const ConnectionChange &) const = default;
};

} // namespace gamenet::net
