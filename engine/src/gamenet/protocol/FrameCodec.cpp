#include <gamenet/protocol/FrameCodec.hpp>

namespace gamenet::protocol
{

bool sealFrame(crypto::Aead &aead, const crypto::Key &key, FrameClass cls, std::uint64_t sequence,
               std::span<std::byte> frame) noexcept
{
    if (frame.size() < kMinFrameSize || frame.size() - kHeaderSize > 0xFFFF)
    {
        return false;
    }

    Header header{cls, sequence, static_cast<std::uint16_t>(frame.size() - kHeaderSize)};
    header.encode(frame);

    const auto aad = frame.first(kHeaderSize);
    const auto plain = plainArea(frame);
    const auto tag = frame.last(kTagSize);
    return aead.seal(key, sequence, aad, plain, tag);
}

bool openFrame(crypto::Aead &aead, const crypto::Key &key, const Header &header,
               std::span<std::byte> frame, Frame &out) noexcept
{
    if (header.size < kTagSize || frame.size() != header.frameSize())
    {
        return false;
    }

    const auto aad = frame.first(kHeaderSize);
    const auto cipher = plainArea(frame);
    const auto tag = frame.last(kTagSize);
    if (!aead.open(key, header.sequence, aad, cipher, tag))
    {
        return false;
    }

    out.frameClass = header.frameClass;
    out.sequence = header.sequence;
    out.body = cipher;
    return true;
}

} // namespace gamenet::protocol
