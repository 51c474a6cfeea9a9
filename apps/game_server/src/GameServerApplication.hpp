#pragma once

#include "EchoReplicator.hpp"

#include <gamenet/core/GlobalConfig.hpp>
#include <gamenet/core/SignalHandler.hpp>
#include <gamenet/crypto/Key.hpp>
#include <gamenet/net/Endpoint.hpp>
#include <gamenet/protocol/PayloadBatch.hpp>

#include <chrono>
#include <vector>

namespace game_server
{

/// 고정 틱 루프로 Endpoint 를 구동한다.
/// 틱마다 sync -> 연결 이벤트 처리 -> pull -> replicate 순서.
class GameServerApplication
{
  public:
    GameServerApplication(const gamenet::core::GlobalConfig &cfg,
                          const gamenet::crypto::SecretKey &secret);

    /// 종료 신호가 올 때까지 돈다. 끝나면 모든 채널을 Shutdown 으로 정리한다.
    void run(gamenet::core::SignalHandler &signals);

  private:
    void tick_(gamenet::net::TimePoint now);
    void drainChanges_();

    gamenet::net::Endpoint endpoint_;
    EchoReplicator replicator_;

    gamenet::protocol::PayloadBatch inbound_;
    gamenet::protocol::PayloadBatch scratch_;
    std::vector<gamenet::net::ChannelId> ids_;

    std::chrono::nanoseconds tickInterval_;
    std::uint64_t ticks_{0};
};

} // namespace game_server
