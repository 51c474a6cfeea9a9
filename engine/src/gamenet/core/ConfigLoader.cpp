#include <gamenet/core/ConfigLoader.hpp>

#include <gamenet/core/Logger.hpp>

#include <toml++/toml.hpp>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
using namespace gamenet;
using namespace gamenet::core;

void printUsage(const char *argv0)
{
    std::string exe = "game_server";
    if (argv0 && *argv0)
    {
        exe = std::filesystem::path(argv0).filename().string();
    }
    std::cout << "Usage: " << exe << " --config <path.toml>\n";
}

LogLevel parseLogLevel(std::string_view s)
{
    std::string v(s);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (v == "trace")
        return LogLevel::Trace;
    if (v == "debug")
        return LogLevel::Debug;
    if (v == "info")
        return LogLevel::Info;
    if (v == "warn" || v == "warning")
        return LogLevel::Warn;
    if (v == "error")
        return LogLevel::Error;
    if (v == "fatal")
        return LogLevel::Fatal;

    throw std::invalid_argument("Invalid log level: " + std::string(s));
}

std::optional<std::string> scanCliForConfigPath(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--config" || a == "-c")
        {
            if (i + 1 >= argc || !argv[i + 1] || !*argv[i + 1])
                throw std::runtime_error("--config requires a path");
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

// ---- checked conversions (TOML 정수는 int64) ----

template <typename T>
T checkedUnsigned(std::int64_t v, const char *key, T minValue = 0)
{
    if (v < static_cast<std::int64_t>(minValue) ||
        static_cast<std::uint64_t>(v) > std::numeric_limits<T>::max())
    {
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(v));
    }
    return static_cast<T>(v);
}

int checkedPositiveInt(std::int64_t v, const char *key)
{
    if (v < 1 || v > std::numeric_limits<int>::max())
        throw std::invalid_argument(std::string(key) + " must be a positive int: " + std::to_string(v));
    return static_cast<int>(v);
}

const toml::table &requireTable(const toml::table &root, const char *name)
{
    const auto *t = root[name].as_table();
    if (!t)
        throw std::runtime_error(std::string("Missing required [") + name + "] section");
    return *t;
}

template <typename T>
void readUnsigned(const toml::table &t, const char *key, T &out)
{
    if (auto v = t[key].value<std::int64_t>())
        out = checkedUnsigned<T>(*v, key);
}

void applyEndpointToml(GlobalConfig &cfg, const toml::table &root)
{
    const toml::table &ep = requireTable(root, "endpoint");
    EndpointConfig &e = cfg.endpoint;

    if (auto s = ep["listen_address"].value<std::string>())
        e.listenAddress = *s;
    readUnsigned(ep, "listen_port", e.listenPort);
    if (auto v = ep["listen_backlog"].value<std::int64_t>())
        e.listenBacklog = checkedPositiveInt(*v, "listen_backlog");

    readUnsigned(ep, "chunk_size", e.chunkSize);
    readUnsigned(ep, "max_frame_size", e.maxFrameSize);

    readUnsigned(ep, "handshake_timeout_ms", e.handshakeTimeoutMs);
    readUnsigned(ep, "idle_timeout_ms", e.idleTimeoutMs);
    readUnsigned(ep, "keepalive_interval_ms", e.keepaliveIntervalMs);
    readUnsigned(ep, "housekeeping_interval_ms", e.housekeepingIntervalMs);

    if (auto v = ep["max_poll_events"].value<std::int64_t>())
        e.maxPollEvents = checkedPositiveInt(*v, "max_poll_events");
    readUnsigned(ep, "max_ingress_bytes", e.maxIngressBytes);
    readUnsigned(ep, "max_egress_bytes", e.maxEgressBytes);

    readUnsigned(ep, "protocol_id", e.protocolId);
    readUnsigned(ep, "protocol_version", e.protocolVersion);
}

void applyServerToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *server = root["server"].as_table();
    if (!server)
        return;

    if (auto v = (*server)["tick_rate_hz"].value<std::int64_t>())
        cfg.server.tickRateHz = checkedUnsigned<std::uint32_t>(*v, "tick_rate_hz", 1);
    if (auto s = (*server)["secret_key"].value<std::string>())
        cfg.server.secretKeyHex = *s;
}

void applyLogToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *log = root["log"].as_table();
    if (!log)
        return;

    if (auto s = (*log)["level"].value<std::string>())
        cfg.log.level = parseLogLevel(*s);
    if (auto s = (*log)["file_path"].value<std::string>())
        cfg.log.filePath = *s;
}

GlobalConfig fromTable(const toml::table &root)
{
    GlobalConfig cfg{};
    applyEndpointToml(cfg, root);
    applyServerToml(cfg, root);
    applyLogToml(cfg, root);

    if (!cfg.server.secretKeyHex.empty() && cfg.server.secretKeyHex.size() != 64)
        throw std::invalid_argument("secret_key must be 64 hex chars");

    validateEndpointConfig(cfg.endpoint);
    return cfg;
}

} // namespace

namespace gamenet::core
{

GlobalConfig ConfigLoader::load(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--help" || a == "-h")
        {
            printUsage((argc > 0) ? argv[0] : nullptr);
            std::exit(0);
        }
    }

    auto configOpt = scanCliForConfigPath(argc, argv);
    if (!configOpt.has_value())
    {
        printUsage((argc > 0) ? argv[0] : nullptr);
        throw std::runtime_error("Missing required argument: --config <path.toml>");
    }

    const std::string &configPath = *configOpt;
    if (!std::filesystem::exists(configPath))
    {
        throw std::runtime_error("Config file not found: " + configPath);
    }

    toml::table root;
    try
    {
        root = toml::parse_file(configPath);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }

    GlobalConfig cfg = fromTable(root);
    SLOG_INFO("ConfigLoader", "Loaded", "path={}", configPath);
    return cfg;
}

GlobalConfig ConfigLoader::parse(std::string_view tomlText)
{
    toml::table root;
    try
    {
        root = toml::parse(tomlText);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }
    return fromTable(root);
}

} // namespace gamenet::core
