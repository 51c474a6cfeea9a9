#pragma once

namespace gamenet::util {

/// 복사를 금지하는 베이스 클래스입니다.
///
/// - 소켓 fd, 청크 핸들, 암호 컨텍스트처럼 "소유자가 정확히 하나"여야 하는 타입이 상속합니다.
/// - 이동은 허용됩니다. 이동까지 막아야 하면 NonMovable 을 함께 상속합니다.
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&) = default;
    NonCopyable &operator=(NonCopyable &&) = default;
};

/// 주소가 고정되어야 하는 타입(다른 객체가 참조로 붙잡는 풀/엔드포인트)용 베이스입니다.
class NonMovable {
  protected:
    NonMovable() = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable &) = delete;
    NonMovable &operator=(const NonMovable &) = delete;
    NonMovable(NonMovable &&) = delete;
    NonMovable &operator=(NonMovable &&) = delete;
};

} // namespace gamenet::util
