#pragma once

#include <gamenet/EndpointConfig.hpp>
#include <gamenet/core/Defaults.hpp>
#include <gamenet/core/Logger.hpp>

#include <cstdint>
#include <string>

namespace gamenet::core
{

/// [log] 섹션
struct LogConfig
{
    LogLevel level{LogLevel::Info};

    /// 비어 있으면 std::clog, 아니면 append 모드 파일
    std::string filePath{};
};

/// [server] 섹션. 게임 서버 루프 전용
struct ServerConfig
{
    std::uint32_t tickRateHz{defaults::kTickRateHz};

    /// 64자리 hex. 비어 있으면 기동할 때 새로 만든다(토큰 발급 서버와 공유 불가).
    std::string secretKeyHex{};
};

// 전체 통합 설정
struct GlobalConfig
{
    EndpointConfig endpoint{};
    LogConfig log{};
    ServerConfig server{};
};

} // namespace gamenet::core
