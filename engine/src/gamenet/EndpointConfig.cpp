#include <gamenet/EndpointConfig.hpp>

#include <gamenet/core/Logger.hpp>
#include <gamenet/protocol/FrameCodec.hpp>

#include <stdexcept>
#include <string>

namespace gamenet
{

namespace
{
[[noreturn]] void throwConfigError(const std::string &detail)
{
    auto msg = "[EndpointConfig] " + detail;
    SLOG_ERROR("EndpointConfig", "ValidationError", "msg={}", msg);
    throw std::invalid_argument{msg};
}
} // namespace

void validateEndpointConfig(const EndpointConfig &config)
{
    if (config.listenAddress.empty())
    {
        throwConfigError("listenAddress must not be empty");
    }
    if (config.listenBacklog < 1)
    {
        throwConfigError("listenBacklog must be >= 1");
    }
    if (config.chunkSize < 256)
    {
        throwConfigError("chunkSize is too small (min 256 bytes)");
    }

    // 프레임은 청크 하나 안에서 in-place 로 복호화되므로 청크를 넘을 수 없다.
    if (config.maxFrameSize > config.chunkSize)
    {
        throwConfigError("maxFrameSize must not exceed chunkSize");
    }
    if (config.maxFrameSize < protocol::kMinFrameSize + protocol::kMaxControlBodySize)
    {
        throwConfigError("maxFrameSize is too small to carry a connection token");
    }
    if (config.maxFrameSize > protocol::kHeaderSize + 0xFFFF)
    {
        throwConfigError("maxFrameSize exceeds what the u16 size field can describe");
    }

    if (config.handshakeTimeoutMs == 0)
    {
        throwConfigError("handshakeTimeoutMs must be > 0");
    }
    if (config.idleTimeoutMs == 0)
    {
        throwConfigError("idleTimeoutMs must be > 0");
    }
    if (config.keepaliveIntervalMs == 0 || config.keepaliveIntervalMs >= config.idleTimeoutMs)
    {
        throwConfigError("keepaliveIntervalMs must be in (0, idleTimeoutMs)");
    }
    if (config.housekeepingIntervalMs == 0)
    {
        throwConfigError("housekeepingIntervalMs must be > 0");
    }
    if (config.maxPollEvents < 1)
    {
        throwConfigError("maxPollEvents must be >= 1");
    }
    if (config.maxIngressBytes < config.maxFrameSize)
    {
        throwConfigError("maxIngressBytes must hold at least one full frame");
    }
    if (config.maxEgressBytes < config.maxFrameSize)
    {
        throwConfigError("maxEgressBytes must hold at least one full frame");
    }
}

} // namespace gamenet
