#pragma once

#include <cstddef> // std::size_t
#include <cstdint>
#include <limits>
#include <vector>

#include <gamenet/buffer/Chunk.hpp>
#include <gamenet/util/NonCopyable.hpp>

namespace gamenet::buffer {

class ChunkPool;

/// ChunkPool 아레나 안의 청크 하나를 가리키는 move-only 핸들입니다.
///
/// - 핸들의 이동이 곧 소유권 이동이다. 복사본(별칭)은 만들 수 없다.
/// - 이동된 쪽은 valid() == false 가 된다.
class ChunkHandle : private gamenet::util::NonCopyable {
  public:
    static constexpr std::uint32_t kInvalid = std::numeric_limits<std::uint32_t>::max();

    ChunkHandle() noexcept = default;
    ChunkHandle(ChunkHandle &&other) noexcept : index_(other.index_) { other.index_ = kInvalid; }
    ChunkHandle &operator=(ChunkHandle &&other) noexcept
    {
        if (this != &other) {
            index_ = other.index_;
            other.index_ = kInvalid;
        }
        return *this;
    }

    [[nodiscard]] bool valid() const noexcept { return index_ != kInvalid; }
    [[nodiscard]] std::uint32_t index() const noexcept { return index_; }

  private:
    friend class ChunkPool;
    explicit ChunkHandle(std::uint32_t index) noexcept : index_(index) {}

    std::uint32_t index_{kInvalid};
};

/// 고정 크기 청크의 아레나 + free list 입니다. (단일 스레드 전용)
///
/// - 청크는 한 번 만들어지면 프로세스가 끝날 때까지 아레나에 남고 재사용된다.
/// - 모든 청크는 항상 "풀(idle)" 또는 "어떤 Buffer" 중 정확히 한 곳이 소유한다.
/// - acquire() 는 idle 청크를 비운 상태로 돌려주고, 없으면 새로 만든다.
/// - release() 는 비어 있는 청크만 받는다.
class ChunkPool : private gamenet::util::NonMovable {
  public:
    /// @param chunkSize 청크 용량(bytes, 0 불가)
    /// @param preallocate 미리 만들어 둘 idle 청크 개수
    explicit ChunkPool(std::size_t chunkSize, std::size_t preallocate = 0);

    [[nodiscard]] ChunkHandle acquire();

    /// 비어 있는 청크를 돌려받는다. 성공 시 handle 은 무효화된다.
    /// 데이터가 남아 있거나 무효 핸들이면 false 이며 handle 은 그대로 둔다.
    [[nodiscard]] bool release(ChunkHandle &handle) noexcept;

    /// 핸들이 가리키는 청크. 참조는 다음 acquire() 전까지만 유효하다.
    [[nodiscard]] Chunk &get(const ChunkHandle &handle) noexcept { return chunks_[handle.index_]; }
    [[nodiscard]] const Chunk &get(const ChunkHandle &handle) const noexcept
    {
        return chunks_[handle.index_];
    }

    [[nodiscard]] std::size_t chunkSize() const noexcept { return chunkSize_; }

    /// 지금까지 만들어진 청크 총수(아레나 크기)
    [[nodiscard]] std::size_t totalChunks() const noexcept { return chunks_.size(); }

    /// 풀에서 대기 중인 청크 수
    [[nodiscard]] std::size_t idleChunks() const noexcept { return idle_.size(); }

    /// Buffer 들이 들고 있는 청크 수
    [[nodiscard]] std::size_t inUseChunks() const noexcept { return chunks_.size() - idle_.size(); }

  private:
    std::size_t chunkSize_{0};
    std::vector<Chunk> chunks_;
    std::vector<std::uint32_t> idle_; // LIFO: 최근 반납된 청크가 캐시에 남아 있을 확률이 높다
};

} // namespace gamenet::buffer
