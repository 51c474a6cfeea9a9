#pragma once

#include <gamenet/Replicator.hpp>
#include <gamenet/protocol/PayloadBatch.hpp>

#include <cstddef>
#include <unordered_map>

namespace game_server
{

/// 샘플 게임 로직: 클라이언트가 보낸 메시지를 다음 틱에 그대로 돌려준다.
class EchoReplicator final : public gamenet::IReplicator
{
  public:
    /// 이번 틱에 받은 메시지를 client 앞으로 쌓는다.
    void stash(gamenet::net::ClientId client, const gamenet::protocol::PayloadBatch &inbound);

    /// 연결이 끊긴 클라이언트의 대기 메시지를 버린다.
    void forget(gamenet::net::ClientId client);

    void record(gamenet::net::ClientId client, gamenet::protocol::PayloadBatch &outBatch) override;

    [[nodiscard]] std::size_t pendingClients() const noexcept { return pending_.size(); }

  private:
    std::unordered_map<gamenet::net::ClientId, gamenet::protocol::PayloadBatch> pending_;
};

} // namespace game_server
