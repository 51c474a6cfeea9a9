#pragma once

#include <gamenet/core/GlobalConfig.hpp>

#include <string_view>

namespace gamenet::core
{

class ConfigLoader
{
  public:
    /// --config <path.toml> 을 읽어 검증까지 끝낸 설정을 돌려준다.
    /// 인자 누락/파일 없음/TOML 오류/범위 위반은 예외로 즉시 실패한다.
    static GlobalConfig load(int argc, char **argv);

    /// TOML 문자열에서 읽는다(테스트용). 규칙은 load() 와 같다.
    static GlobalConfig parse(std::string_view tomlText);
};

} // namespace gamenet::core
