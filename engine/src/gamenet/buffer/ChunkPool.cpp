#include <gamenet/buffer/ChunkPool.hpp>

#include <gamenet/core/Logger.hpp>

#include <stdexcept>

namespace gamenet::buffer
{

ChunkPool::ChunkPool(std::size_t chunkSize, std::size_t preallocate) : chunkSize_(chunkSize)
{
    if (chunkSize_ == 0)
    {
        throw std::invalid_argument("ChunkPool chunkSize must be greater than 0");
    }

    chunks_.reserve(preallocate);
    idle_.reserve(preallocate);
    for (std::size_t i = 0; i < preallocate; ++i)
    {
        chunks_.emplace_back(chunkSize_);
        idle_.push_back(static_cast<std::uint32_t>(i));
    }
}

ChunkHandle ChunkPool::acquire()
{
    if (!idle_.empty())
    {
        const std::uint32_t index = idle_.back();
        idle_.pop_back();
        chunks_[index].reset();
        return ChunkHandle{index};
    }

    if (chunks_.size() >= ChunkHandle::kInvalid)
    {
        throw std::length_error("ChunkPool arena exhausted");
    }

    // 풀이 비었으면 아레나를 키운다. Chunk 는 힙 블록을 소유하므로 벡터 재배치에도
    // 데이터 주소는 바뀌지 않는다.
    const auto index = static_cast<std::uint32_t>(chunks_.size());
    chunks_.emplace_back(chunkSize_);

    SLOG_TRACE("ChunkPool", "Grow", "total={} chunk_size={}", chunks_.size(), chunkSize_);
    return ChunkHandle{index};
}

bool ChunkPool::release(ChunkHandle &handle) noexcept
{
    if (!handle.valid() || handle.index_ >= chunks_.size())
    {
        SLOG_ERROR("ChunkPool", "ReleaseRejected", "reason=InvalidHandle index={}", handle.index_);
        return false;
    }

    Chunk &chunk = chunks_[handle.index_];
    if (!chunk.empty())
    {
        SLOG_ERROR("ChunkPool", "ReleaseRejected", "reason=NotDrained index={} size={}",
                   handle.index_, chunk.size());
        return false;
    }

    chunk.reset();
    idle_.push_back(handle.index_);
    handle.index_ = ChunkHandle::kInvalid;
    return true;
}

} // namespace gamenet::buffer
