#include <gamenet/core/LoggingConfig.hpp>

#include <gamenet/core/Logger.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace gamenet::core
{
namespace
{

// 파일 스트림 수명을 Logger 보다 길게 잡아 둔다.
class OwningOstreamLogger final : public ILogger
{
  public:
    OwningOstreamLogger(std::shared_ptr<std::ostream> os, LogLevel lvl)
        : os_(std::move(os)), logger_(*os_)
    {
        logger_.setMinLevel(lvl);
    }

    void log(LogLevel level, std::string_view message) override { logger_.log(level, message); }
    [[nodiscard]] LogLevel minLevel() const noexcept override { return logger_.minLevel(); }
    void shutdown() noexcept override { logger_.stopAndJoin(); }

  private:
    std::shared_ptr<std::ostream> os_;
    Logger logger_;
};

} // namespace

void applyLoggingConfig(const LogConfig &cfg)
{
    if (cfg.filePath.empty())
    {
        auto os = std::shared_ptr<std::ostream>(&std::clog, [](std::ostream *) {});
        setLogger(std::make_shared<OwningOstreamLogger>(std::move(os), cfg.level));
        return;
    }

    auto file = std::make_shared<std::ofstream>(cfg.filePath, std::ios::app);
    if (!file->is_open())
    {
        throw std::runtime_error("[LoggingConfig] failed to open log file: " + cfg.filePath);
    }

    std::shared_ptr<std::ostream> os = file;
    setLogger(std::make_shared<OwningOstreamLogger>(std::move(os), cfg.level));
}

} // namespace gamenet::core
