#pragma once

#include <gamenet/core/GlobalConfig.hpp>

namespace gamenet::core
{

/// [log] 설정(레벨/파일)을 프로세스 전역 Logger 에 반영합니다.
/// 파일을 열 수 없으면 std::runtime_error.
void applyLoggingConfig(const LogConfig &cfg);

} // namespace gamenet::core
