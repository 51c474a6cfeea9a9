#include <gamenet/buffer/Chunk.hpp>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace gamenet::buffer
{

Chunk::Chunk(std::size_t capacity) : capacity_(capacity)
{
    if (capacity_ == 0)
    {
        throw std::invalid_argument("Chunk capacity must be greater than 0");
    }
    // 초기화하지 않는다. 읽기 구간 밖의 바이트는 절대 노출되지 않는다.
    data_ = std::make_unique_for_overwrite<std::byte[]>(capacity_);
}

std::size_t Chunk::commit(std::size_t n) noexcept
{
    const std::size_t take = std::min(n, freeSpace());
    end_ += take;
    return take;
}

std::size_t Chunk::consume(std::size_t n) noexcept
{
    const std::size_t take = std::min(n, size());
    begin_ += take;
    if (begin_ == end_)
    {
        reset();
    }
    return take;
}

std::size_t Chunk::append(std::span<const std::byte> src) noexcept
{
    const std::size_t take = std::min(src.size(), freeSpace());
    if (take > 0)
    {
        std::memcpy(data_.get() + end_, src.data(), take);
        end_ += take;
    }
    return take;
}

void Chunk::compact() noexcept
{
    if (begin_ == 0)
    {
        return;
    }
    const std::size_t n = size();
    if (n > 0)
    {
        std::memmove(data_.get(), data_.get() + begin_, n);
    }
    begin_ = 0;
    end_ = n;
}

} // namespace gamenet::buffer
