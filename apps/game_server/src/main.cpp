#include "GameServerApplication.hpp"

#include <gamenet/core/ConfigLoader.hpp>
#include <gamenet/core/Logger.hpp>
#include <gamenet/core/LoggingConfig.hpp>
#include <gamenet/core/SignalHandler.hpp>
#include <gamenet/crypto/Key.hpp>

#include <iostream>

namespace
{
gamenet::crypto::SecretKey loadSecret(const gamenet::core::ServerConfig &server)
{
    if (!server.secretKeyHex.empty())
    {
        return gamenet::crypto::SecretKey::fromHex(server.secretKeyHex);
    }

    auto key = gamenet::crypto::SecretKey::generate();
    SLOG_WARN("GameServer", "EphemeralSecretKey", "fingerprint={} note='tokens from other processes will be rejected'",
              key.fingerprint());
    return key;
}
} // namespace

int main(int argc, char **argv)
{
    try
    {
        const auto cfg = gamenet::core::ConfigLoader::load(argc, argv);
        gamenet::core::applyLoggingConfig(cfg.log);

        const auto secret = loadSecret(cfg.server);

        gamenet::core::SignalHandler signals;
        game_server::GameServerApplication app(cfg, secret);
        app.run(signals);

        gamenet::core::shutdownLogger();
        return 0;
    }
    catch (const std::exception &e)
    {
        SLOG_FATAL("GameServer", "Aborted", "what='{}'", e.what());
        gamenet::core::shutdownLogger();
        std::cerr << "game_server: " << e.what() << "\n";
        return 1;
    }
}
