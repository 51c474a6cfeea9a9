#include "GameServerApplication.hpp"

#include <gamenet/core/Logger.hpp>

#include <thread>

namespace game_server
{

using gamenet::net::ConnectionChange;

GameServerApplication::GameServerApplication(const gamenet::core::GlobalConfig &cfg,
                                             const gamenet::crypto::SecretKey &secret)
    : endpoint_(cfg.endpoint, secret),
      tickInterval_(std::chrono::nanoseconds(std::chrono::seconds(1)) / cfg.server.tickRateHz)
{
    SLOG_INFO("GameServer", "Ready", "port={} tick_hz={}", endpoint_.listenPort(),
              cfg.server.tickRateHz);
}

void GameServerApplication::run(gamenet::core::SignalHandler &signals)
{
    auto next = gamenet::net::Clock::now();

    while (!signals.isStopRequested())
    {
        const auto now = gamenet::net::Clock::now();
        tick_(now);

        next += tickInterval_;
        if (next < now)
        {
            // 틱이 밀렸다. 따라잡지 않고 현재 시각부터 다시 센다.
            SLOG_DEBUG("GameServer", "TickOverrun", "tick={}", ticks_);
            next = now + tickInterval_;
        }
        std::this_thread::sleep_until(next);
    }

    int signo = 0;
    (void)signals.consumeStopRequest(&signo);
    SLOG_INFO("GameServer", "Stopping", "signal={} ticks={} connected={}",
              gamenet::core::SignalHandler::signalName(signo), ticks_, endpoint_.connectedCount());

    endpoint_.shutdown();
    drainChanges_();
}

void GameServerApplication::tick_(gamenet::net::TimePoint now)
{
    ++ticks_;
    endpoint_.sync(now);
    drainChanges_();

    const auto connected = endpoint_.connectedChannels();
    ids_.assign(connected.begin(), connected.end());
    for (const auto id : ids_)
    {
        const auto client = endpoint_.clientId(id);
        inbound_.clear();
        endpoint_.pull(id, inbound_);
        if (client && !inbound_.empty())
        {
            replicator_.stash(*client, inbound_);
        }
    }
    // pull 중 끊긴 채널 이벤트도 같은 틱에 반영한다.
    drainChanges_();

    endpoint_.replicate(replicator_, scratch_);
}

void GameServerApplication::drainChanges_()
{
    for (const auto &change : endpoint_.changes())
    {
        if (change.kind == ConnectionChange::Kind::Connected)
        {
            SLOG_INFO("GameServer", "PlayerJoined", "cid={} client={}", change.channel,
                      change.clientId);
            continue;
        }

        SLOG_INFO("GameServer", "PlayerLeft", "cid={} client={} reason={}", change.channel,
                  change.clientId, gamenet::protocol::toString(change.reason));
        replicator_.forget(change.clientId);
    }
}

} // namespace game_server
