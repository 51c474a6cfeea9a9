#pragma once

#include <cstddef>
#include <memory>
#include <span>

namespace gamenet::buffer {

/// 고정 용량 바이트 블록. 읽기 가능한 구간은 [begin, end) 이다.
///
/// - 쓰기는 end 뒤(tail)에 붙고, 읽기는 begin 에서 소비한다.
/// - begin == end 가 되면 비어 있는 것이며, consume() 이 커서를 0 으로 되돌린다.
class Chunk {
  public:
    explicit Chunk(std::size_t capacity);

    Chunk(Chunk &&) noexcept = default;
    Chunk &operator=(Chunk &&) noexcept = default;
    Chunk(const Chunk &) = delete;
    Chunk &operator=(const Chunk &) = delete;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t size() const noexcept { return end_ - begin_; }
    [[nodiscard]] bool empty() const noexcept { return begin_ == end_; }

    /// tail 에 남은 쓰기 가능 공간
    [[nodiscard]] std::size_t freeSpace() const noexcept { return capacity_ - end_; }

    /// begin 앞의 소비된 공간까지 포함한, compact() 후 얻을 수 있는 최대 공간
    [[nodiscard]] std::size_t reclaimableSpace() const noexcept { return capacity_ - size(); }

    [[nodiscard]] std::span<std::byte> readable() noexcept { return {data_.get() + begin_, size()}; }
    [[nodiscard]] std::span<const std::byte> readable() const noexcept
    {
        return {data_.get() + begin_, size()};
    }
    [[nodiscard]] std::span<std::byte> writable() noexcept { return {data_.get() + end_, freeSpace()}; }

    /// writable() 에 직접 쓴 n 바이트를 확정한다. freeSpace() 를 넘지 않도록 잘라낸다.
    std::size_t commit(std::size_t n) noexcept;

    /// 앞에서 n 바이트를 소비한다. 비게 되면 커서를 0 으로 되돌린다.
    std::size_t consume(std::size_t n) noexcept;

    /// src 를 가능한 만큼 tail 에 복사하고 복사한 바이트 수를 돌려준다.
    std::size_t append(std::span<const std::byte> src) noexcept;

    /// 읽지 않은 데이터를 블록 앞쪽으로 옮겨 tail 공간을 최대로 만든다.
    void compact() noexcept;

    void reset() noexcept { begin_ = end_ = 0; }

  private:
    std::unique_ptr<std::byte[]> data_;
    std::size_t capacity_{0};
    std::size_t begin_{0};
    std::size_t end_{0};
};

} // namespace gamenet::buffer
