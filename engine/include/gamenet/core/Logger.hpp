#pragma once

#include <gamenet/util/NonCopyable.hpp>

#include <atomic>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace gamenet::core
{

enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

[[nodiscard]] std::string_view toString(LogLevel level) noexcept;

namespace detail
{
// 레벨 필터 fast path (Logger.cpp 에서 정의)
std::atomic<int> &fastMinLevel();
} // namespace detail

/// 틱 루프(hot path)에서 포맷 비용을 치르기 전에 먼저 확인한다.
inline bool fastEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::fastMinLevel().load(std::memory_order_relaxed);
}

/// 로깅 백엔드 인터페이스.
/// message 는 이미 "comp | evt | k=v ..." 형태로 조립되어 들어온다.
class ILogger : private gamenet::util::NonCopyable
{
  public:
    virtual ~ILogger() = default;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void shutdown() noexcept {}

    virtual void log(LogLevel level, std::string_view message) = 0;
};

/// 기본 구현체. 호출 스레드는 큐에 넣기만 하고, 별도 writer 스레드가 ostream 에 쓴다.
/// - 단일 스레드 틱 루프가 I/O(콘솔/파일)로 멈추지 않게 하기 위함.
class Logger final : public ILogger
{
  public:
    explicit Logger(std::ostream &os = std::clog);
    ~Logger() override;

    void log(LogLevel level, std::string_view message) override;

    void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel minLevel() const noexcept override;

    /// writer 스레드를 멈추고 큐에 남은 로그를 모두 flush 한다.
    void stopAndJoin();
    void shutdown() noexcept override { stopAndJoin(); }

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

ILogger &getLogger();
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
void shutdownLogger() noexcept;

// =============================================================================
// Structured logging frontend
//   최종 라인: "HH:MM:SS.uuuuuu | tid=123 | INFO  | Endpoint | Connected | cid=3 client=42"
//   - time/thread/level prefix 는 Logger 가 붙인다
//   - 여기서는 "comp | evt | details" 만 만든다
// =============================================================================
namespace slog
{
inline std::string build(std::string_view comp, std::string_view evt, std::string_view details)
{
    if (details.empty())
        return std::format("{} | {}", comp, evt);
    return std::format("{} | {} | {}", comp, evt, details);
}

inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt)
{
    if (!fastEnabled(lvl))
        return;
    getLogger().log(lvl, build(comp, evt, {}));
}

template <typename... Args>
inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt,
                 std::format_string<Args...> fmt, Args &&...args)
{
    if (!fastEnabled(lvl))
        return;
    std::string details = std::format(fmt, std::forward<Args>(args)...);
    getLogger().log(lvl, build(comp, evt, details));
}
} // namespace slog

#define SLOG_TRACE(comp, evt, ...)                                                                 \
    ::gamenet::core::slog::emit(::gamenet::core::LogLevel::Trace, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_DEBUG(comp, evt, ...)                                                                 \
    ::gamenet::core::slog::emit(::gamenet::core::LogLevel::Debug, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_INFO(comp, evt, ...)                                                                  \
    ::gamenet::core::slog::emit(::gamenet::core::LogLevel::Info, (comp),                           \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_WARN(comp, evt, ...)                                                                  \
    ::gamenet::core::slog::emit(::gamenet::core::LogLevel::Warn, (comp),                           \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_ERROR(comp, evt, ...)                                                                 \
    ::gamenet::core::slog::emit(::gamenet::core::LogLevel::Error, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_FATAL(comp, evt, ...)                                                                 \
    ::gamenet::core::slog::emit(::gamenet::core::LogLevel::Fatal, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)

} // namespace gamenet::core
