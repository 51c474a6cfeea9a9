#include <gamenet/protocol/PayloadBatch.hpp>

#include <gamenet/protocol/MessageCodec.hpp>

#include <algorithm>
#include <stdexcept>

namespace gamenet::protocol
{

PayloadBatch::PayloadBatch(std::size_t reserveBytes, std::size_t reserveMessages)
{
    bytes_.reserve(reserveBytes);
    entries_.reserve(reserveMessages);
}

void PayloadBatch::add(std::span<const std::byte> message)
{
    if (message.size() > kMaxMessageSize)
    {
        throw std::length_error("PayloadBatch message exceeds u16 length prefix");
    }
    entries_.push_back(Entry{bytes_.size(), message.size()});
    bytes_.insert(bytes_.end(), message.begin(), message.end());
}

std::span<const std::byte> PayloadBatch::operator[](std::size_t i) const noexcept
{
    const Entry &e = entries_[head_ + i];
    return std::span<const std::byte>(bytes_).subspan(e.offset, e.length);
}

void PayloadBatch::clear() noexcept
{
    bytes_.clear();
    entries_.clear();
    head_ = 0;
}

void PayloadBatch::dropFront(std::size_t n) noexcept
{
    head_ += std::min(n, size());
    if (head_ == entries_.size())
    {
        clear();
    }
}

void PayloadBatch::truncate(std::size_t count) noexcept
{
    if (count >= size())
    {
        return;
    }
    const std::size_t keep = head_ + count;
    if (keep == 0)
    {
        clear();
        return;
    }
    bytes_.resize(entries_[keep].offset);
    entries_.resize(keep);
}

bool PayloadBatch::appendFromBody(std::span<const std::byte> body)
{
    const std::size_t before = size();
    ByteReader r(body);

    while (!r.atEnd())
    {
        std::uint16_t len = 0;
        std::span<const std::byte> message;
        if (!r.readU16Be(len) || !r.readBytesView(len, message))
        {
            truncate(before);
            return false;
        }
        add(message);
    }
    return true;
}

} // namespace gamenet::protocol
