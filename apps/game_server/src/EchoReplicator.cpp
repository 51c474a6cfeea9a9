#include "EchoReplicator.hpp"

namespace game_server
{

void EchoReplicator::stash(gamenet::net::ClientId client,
                           const gamenet::protocol::PayloadBatch &inbound)
{
    if (inbound.empty())
        return;

    auto &queue = pending_[client];
    for (std::size_t i = 0; i < inbound.size(); ++i)
    {
        queue.add(inbound[i]);
    }
}

void EchoReplicator::forget(gamenet::net::ClientId client)
{
    pending_.erase(client);
}

void EchoReplicator::record(gamenet::net::ClientId client,
                            gamenet::protocol::PayloadBatch &outBatch)
{
    auto it = pending_.find(client);
    if (it == pending_.end())
        return;

    auto &queue = it->second;
    for (std::size_t i = 0; i < queue.size(); ++i)
    {
        outBatch.add(queue[i]);
    }
    queue.clear();
}

} // namespace game_server
