#include <gamenet/buffer/Buffer.hpp>

#include <gamenet/core/Logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace gamenet::buffer
{

Buffer::Buffer(ChunkPool &pool) : pool_(pool)
{
    pushBack_();
}

Buffer::~Buffer()
{
    for (auto &handle : chunks_)
    {
        pool_.get(handle).reset();
        release_(handle);
    }
}

void Buffer::pushBack_()
{
    chunks_.push_back(pool_.acquire());
}

void Buffer::release_(ChunkHandle &handle) noexcept
{
    if (!pool_.release(handle))
    {
        SLOG_ERROR("Buffer", "ChunkLeak", "index={}", handle.index());
    }
}

void Buffer::popFront_() noexcept
{
    ChunkHandle handle = std::move(chunks_.front());
    chunks_.pop_front();
    release_(handle);
}

void Buffer::write(std::span<const std::byte> bytes)
{
    while (!bytes.empty())
    {
        if (back_().freeSpace() == 0)
        {
            pushBack_();
        }
        const std::size_t n = back_().append(bytes);
        size_ += n;
        bytes = bytes.subspan(n);
    }
}

std::span<std::byte> Buffer::reserve(std::size_t n)
{
    if (n > pool_.chunkSize())
    {
        return {};
    }

    if (back_().freeSpace() < n)
    {
        if (back_().empty())
        {
            back_().reset();
        }
        else
        {
            // 남은 tail 은 버려진다. 이미 쓴 데이터는 옮기지 않는다.
            pushBack_();
        }
    }
    return back_().writable().first(n);
}

void Buffer::commit(std::size_t n) noexcept
{
    size_ += back_().commit(n);
}

std::span<std::byte> Buffer::readUpto(std::size_t n) noexcept
{
    if (size_ == 0)
    {
        return {};
    }
    auto view = front_().readable();
    return view.first(std::min(n, view.size()));
}

std::span<std::byte> Buffer::contiguous(std::size_t n) noexcept
{
    if (n == 0 || size_ < n || n > pool_.chunkSize())
    {
        return {};
    }

    if (front_().size() >= n)
    {
        return front_().readable().first(n);
    }

    // 레코드가 청크 경계에 걸쳐 있다: 그 분량만 front 로 모은다.
    if (front_().size() + front_().freeSpace() < n)
    {
        front_().compact();
    }

    while (front_().size() < n)
    {
        Chunk &front = front_();
        Chunk &next = pool_.get(chunks_[1]);

        const std::size_t want = std::min(n - front.size(), next.size());
        const std::size_t moved = front.append(next.readable().first(want));
        next.consume(moved);

        if (next.empty())
        {
            next.reset();
            ChunkHandle handle = std::move(chunks_[1]);
            chunks_.erase(chunks_.begin() + 1);
            release_(handle);
        }
    }

    SLOG_TRACE("Buffer", "Compacted", "bytes={} chunks={}", n, chunks_.size());
    return front_().readable().first(n);
}

std::size_t Buffer::read(std::span<std::byte> dst) noexcept
{
    std::size_t copied = 0;
    while (copied < dst.size() && size_ > 0)
    {
        const auto view = readUpto(dst.size() - copied);
        std::memcpy(dst.data() + copied, view.data(), view.size());
        copied += view.size();
        consume(view.size());
    }
    return copied;
}

void Buffer::consume(std::size_t n) noexcept
{
    while (n > 0 && size_ > 0)
    {
        const std::size_t taken = front_().consume(n);
        size_ -= taken;
        n -= taken;

        if (front_().empty() && chunks_.size() > 1)
        {
            popFront_();
        }
    }
}

void Buffer::clear() noexcept
{
    while (chunks_.size() > 1)
    {
        front_().reset();
        popFront_();
    }
    front_().reset();
    size_ = 0;
}

IoResult Buffer::readFrom(IByteSource &source, std::size_t limit)
{
    IoResult result{};

    while (result.bytes < limit)
    {
        if (back_().freeSpace() == 0)
        {
            pushBack_();
        }

        auto space = back_().writable();
        const std::size_t want = std::min(space.size(), limit - result.bytes);

        const ::ssize_t n = source.readSome(space.data(), want);
        if (n > 0)
        {
            const auto got = static_cast<std::size_t>(n);
            back_().commit(got);
            size_ += got;
            result.bytes += got;
            continue;
        }

        if (n == 0)
        {
            // EOF: 상대가 송신 방향을 닫았다. 먼저 온 바이트는 살려 둔다.
            result.status = (result.bytes > 0) ? IoStatus::Progress : IoStatus::WouldBlock;
            result.eof = true;
            return result;
        }

        if (errno == EINTR)
        {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            result.status = (result.bytes > 0) ? IoStatus::Progress : IoStatus::WouldBlock;
            return result;
        }

        result.status = IoStatus::Failed;
        result.error = errno;
        return result;
    }

    result.status = IoStatus::Progress;
    return result;
}

IoResult Buffer::writeTo(IByteSink &sink) noexcept
{
    IoResult result{};

    while (size_ > 0)
    {
        const auto view = front_().readable();
        if (view.empty())
        {
            popFront_();
            continue;
        }

        const ::ssize_t n = sink.writeSome(view.data(), view.size());
        if (n > 0)
        {
            const auto sent = static_cast<std::size_t>(n);
            consume(sent);
            result.bytes += sent;
            continue;
        }

        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n == 0 || errno == EAGAIN || errno == EWOULDBLOCK)
        {
            result.status = (result.bytes > 0) ? IoStatus::Progress : IoStatus::WouldBlock;
            return result;
        }

        result.status = IoStatus::Failed;
        result.error = errno;
        return result;
    }

    result.status = IoStatus::Progress;
    return result;
}

} // namespace gamenet::buffer
