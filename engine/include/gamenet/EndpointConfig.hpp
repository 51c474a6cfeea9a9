#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <gamenet/core/Defaults.hpp>

namespace gamenet
{

/// Endpoint 가 소비하는 설정 값 전체입니다.
///
/// Endpoint/Channel 로직은 이 구조체의 값만 사용합니다. 기본값은 core::defaults 에서 온다.
struct EndpointConfig
{
    /// 리스닝 소켓을 바인딩할 IPv4 주소입니다.
    std::string listenAddress = "0.0.0.0";

    /// 리스닝 포트. 0 이면 커널이 임의 포트를 고릅니다(테스트용).
    std::uint16_t listenPort = 7777;

    /// listen(2) backlog
    int listenBacklog = core::defaults::kListenBacklog;

    /// 청크 하나의 용량(bytes).
    std::size_t chunkSize = core::defaults::kChunkSize;

    /// 프레임 최대 크기(header + ciphertext + tag). chunkSize 이하여야 한다.
    std::size_t maxFrameSize = core::defaults::kMaxFrameSize;

    /// accept 후 토큰이 도착해야 하는 시간(ms)
    std::uint32_t handshakeTimeoutMs = core::defaults::kHandshakeTimeoutMs;

    /// 상대에게서 아무것도 받지 못한 채 허용되는 시간(ms)
    std::uint32_t idleTimeoutMs = core::defaults::kIdleTimeoutMs;

    /// 송신이 없을 때 keepalive 를 보내는 간격(ms)
    std::uint32_t keepaliveIntervalMs = core::defaults::kKeepaliveIntervalMs;

    /// sync() 가 housekeeping() 을 부르는 주기(ms)
    std::uint32_t housekeepingIntervalMs = core::defaults::kHousekeepingIntervalMs;

    /// epoll_wait 1회당 최대 이벤트 수
    int maxPollEvents = core::defaults::kMaxPollEvents;

    /// 채널당 읽기 버퍼에 쌓아둘 최대 바이트 수
    std::size_t maxIngressBytes = core::defaults::kMaxIngressBytes;

    /// 채널당 쓰기 버퍼에 쌓아둘 최대 바이트 수
    std::size_t maxEgressBytes = core::defaults::kMaxEgressBytes;

    std::uint16_t protocolId = core::defaults::kProtocolId;
    std::uint16_t protocolVersion = core::defaults::kProtocolVersion;
};

/// 값 범위와 상호 제약을 검사합니다. 위반 시 std::invalid_argument.
void validateEndpointConfig(const EndpointConfig &config);

} // namespace gamenet
