#pragma once

#include <cstddef>
#include <deque>
#include <limits>
#include <span>

#include <gamenet/buffer/ByteStream.hpp>
#include <gamenet/buffer/ChunkPool.hpp>
#include <gamenet/util/NonCopyable.hpp>

namespace gamenet::buffer {

/// ChunkPool 청크들의 순서 있는 큐로 구성된 바이트 버퍼입니다.
///
/// ===== 구조 =====
/// - front = 가장 오래된 미소비 데이터, back = 가장 최근에 쓴 데이터.
/// - 쓰기는 back 청크 tail 에 붙이고, 가득 차면 풀에서 새 청크를 받는다.
/// - 읽기는 front 에서 소비하고, front 가 비면(그리고 마지막 하나가 아니면) 풀에 반납한다.
/// - 버퍼는 항상 최소 1개의 청크를 들고 있다.
///
/// ===== 복사 규약 =====
/// - 이미 쓴 데이터는 옮기지 않는다. 예외는 contiguous() 뿐이며,
///   레코드가 청크 경계에 걸친 경우에만 그 레코드 분량을 front 로 모은다.
///
/// ===== 외부 I/O =====
/// - readFrom()/writeTo() 만 바깥(소켓 등)과 닿는다. 나머지는 순수 메모리 관리다.
class Buffer : private gamenet::util::NonMovable {
  public:
    explicit Buffer(ChunkPool &pool);
    ~Buffer();

    /// 읽기 가능한 총 바이트 수 (모든 청크의 end - begin 합)
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] std::size_t chunkCount() const noexcept { return chunks_.size(); }

    /// 바이트를 뒤에 붙인다. 필요한 만큼 풀에서 청크를 받는다.
    void write(std::span<const std::byte> bytes);

    /// back 에 n 바이트 연속 공간을 확보해 돌려준다. 호출자는 직접 쓰고 commit() 한다.
    /// n 이 청크 용량보다 크면 빈 span 을 돌려준다.
    [[nodiscard]] std::span<std::byte> reserve(std::size_t n);

    /// reserve() 로 받은 공간 중 앞쪽 n 바이트를 확정한다.
    void commit(std::size_t n) noexcept;

    /// front 청크 안에서 연속된 최대 n 바이트 view (복사 없음, 청크 경계에서 잘린다)
    [[nodiscard]] std::span<std::byte> readUpto(std::size_t n) noexcept;

    /// 앞쪽 n 바이트를 한 청크 안에 연속으로 모아 돌려준다.
    ///
    /// - 이미 연속이면 복사 없이 view 만 준다.
    /// - 경계에 걸쳐 있으면 그 n 바이트만 front 청크로 모은다(compacting read).
    /// - size() < n 이거나 n > 청크 용량이면 빈 span.
    [[nodiscard]] std::span<std::byte> contiguous(std::size_t n) noexcept;

    /// dst 로 복사하면서 소비한다. 복사한 바이트 수를 돌려준다.
    std::size_t read(std::span<std::byte> dst) noexcept;

    /// 앞에서 n 바이트를 버린다. 비워진 청크는 풀로 돌아간다.
    void consume(std::size_t n) noexcept;

    /// 모든 데이터를 버리고 청크 1개만 남긴다.
    void clear() noexcept;

    /// source 가 주는 만큼(최대 limit) 읽어 들인다. would-block / EOF / 오류에서 멈춘다.
    [[nodiscard]] IoResult readFrom(IByteSource &source,
                                    std::size_t limit = std::numeric_limits<std::size_t>::max());

    /// sink 가 받는 만큼 내보낸다. would-block / 오류에서 멈춘다.
    [[nodiscard]] IoResult writeTo(IByteSink &sink) noexcept;

  private:
    Chunk &front_() noexcept { return pool_.get(chunks_.front()); }
    Chunk &back_() noexcept { return pool_.get(chunks_.back()); }

    void pushBack_();
    void popFront_() noexcept;
    void release_(ChunkHandle &handle) noexcept;

    ChunkPool &pool_;
    std::deque<ChunkHandle> chunks_;
    std::size_t size_{0};
};

} // namespace gamenet::buffer
