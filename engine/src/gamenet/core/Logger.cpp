#include <gamenet/core/Logger.hpp>

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <format>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include <sys/syscall.h> // SYS_gettid
#include <unistd.h>      // syscall, isatty, fileno

namespace gamenet::core
{

namespace detail
{
std::atomic<int> &fastMinLevel()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
} // namespace detail

std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "INFO";
}

namespace
{

long currentTid() noexcept
{
    thread_local long tid = static_cast<long>(::syscall(SYS_gettid));
    return tid;
}

const char *levelColor(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "\x1b[90m";
    case LogLevel::Debug:
        return "\x1b[36m";
    case LogLevel::Info:
        return "\x1b[32m";
    case LogLevel::Warn:
        return "\x1b[33m";
    case LogLevel::Error:
    case LogLevel::Fatal:
        return "\x1b[31m";
    }
    return "";
}

struct LogRecord
{
    LogLevel level{};
    std::string message;
    std::chrono::system_clock::time_point at;
    long tid{};
};

} // namespace

class Logger::Impl
{
  public:
    explicit Impl(std::ostream &os) : os_(os)
    {
        if (&os == &std::cout || &os == &std::clog || &os == &std::cerr)
        {
            useColor_ = (::isatty(::fileno(stderr)) != 0);
        }
        writer_ = std::thread([this]() { run_(); });
    }

    ~Impl() { stop(); }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_)
                return;
            stopped_ = true;
        }
        cv_.notify_all();
        if (writer_.joinable())
            writer_.join();
    }

    void push(LogLevel level, std::string_view msg)
    {
        LogRecord rec{level, std::string(msg), std::chrono::system_clock::now(), currentTid()};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_)
                return; // shutdown 이후 로그는 버린다
            pending_.push_back(std::move(rec));
        }
        cv_.notify_one();
    }

    void setMinLevel(LogLevel level) noexcept
    {
        minLevel_.store(static_cast<int>(level), std::memory_order_relaxed);
        detail::fastMinLevel().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    [[nodiscard]] LogLevel minLevel() const noexcept
    {
        return static_cast<LogLevel>(minLevel_.load(std::memory_order_relaxed));
    }

  private:
    void run_()
    {
        std::vector<LogRecord> batch;
        for (;;)
        {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopped_ || !pending_.empty(); });
                if (stopped_ && pending_.empty())
                    return;
                batch.assign(std::make_move_iterator(pending_.begin()),
                             std::make_move_iterator(pending_.end()));
                pending_.clear();
            }

            for (const auto &rec : batch)
            {
                if (rec.level >= minLevel())
                    write_(rec);
            }
            os_.flush();
            batch.clear();
        }
    }

    void write_(const LogRecord &rec)
    {
        using namespace std::chrono;

        const auto t = system_clock::to_time_t(rec.at);
        std::tm tm{};
        localtime_r(&t, &tm);
        const auto us = duration_cast<microseconds>(rec.at.time_since_epoch()) % seconds(1);

        const char *c1 = useColor_ ? levelColor(rec.level) : "";
        const char *c2 = useColor_ ? "\x1b[0m" : "";

        os_ << std::format("{:02d}:{:02d}:{:02d}.{:06d} | tid={} | {}{:<5}{} | {}\n", tm.tm_hour,
                           tm.tm_min, tm.tm_sec, static_cast<int>(us.count()), rec.tid, c1,
                           toString(rec.level), c2, rec.message);
    }

    std::ostream &os_;
    std::thread writer_;
    std::deque<LogRecord> pending_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_{false};
    std::atomic<int> minLevel_{static_cast<int>(LogLevel::Info)};
    bool useColor_{false};
};

Logger::Logger(std::ostream &os) : impl_(std::make_unique<Impl>(os)) {}
Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view message)
{
    impl_->push(level, message);
}

void Logger::setMinLevel(LogLevel level) noexcept
{
    impl_->setMinLevel(level);
}

LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel();
}

void Logger::stopAndJoin()
{
    impl_->stop();
}

// ===== process-wide instance =====

static std::shared_ptr<ILogger> &globalLogger()
{
    static std::shared_ptr<ILogger> logger = std::make_shared<Logger>();
    return logger;
}

ILogger &getLogger()
{
    auto &instance = globalLogger();
    if (!instance)
    {
        instance = std::make_shared<Logger>();
    }
    return *instance;
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    const LogLevel lvl = logger ? logger->minLevel() : LogLevel::Info;
    detail::fastMinLevel().store(static_cast<int>(lvl), std::memory_order_relaxed);
    globalLogger() = std::move(logger);
}

void shutdownLogger() noexcept
{
    auto &instance = globalLogger();
    if (!instance)
        return;
    instance->shutdown();
    instance.reset();
}

} // namespace gamenet::core
