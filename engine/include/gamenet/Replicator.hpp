#pragma once

#include <gamenet/net/ConnectionChange.hpp>
#include <gamenet/protocol/PayloadBatch.hpp>

namespace gamenet
{

/// 게임 로직이 구현하는 복제 계약.
///
/// Endpoint::replicate() 가 틱마다 Connected 클라이언트 하나당 한 번 record() 를 부른다.
/// - outBatch 는 Endpoint 가 비워서 넘긴다. 새 배치를 만들지 말고 여기에 add() 만 한다.
/// - record() 안에서 Endpoint 의 sync/housekeeping/replicate 를 다시 부르면 안 된다.
class IReplicator
{
  public:
    virtual ~IReplicator() = default;

    virtual void record(net::ClientId clientId, protocol::PayloadBatch &outBatch) = 0;
};

} // namespace gamenet
