#include <gamenet/protocol/Header.hpp>

#include <gamenet/protocol/Endian.hpp>

namespace gamenet::protocol
{

std::string_view toString(FrameClass cls) noexcept
{
    switch (cls)
    {
    case FrameClass::Payload:
        return "payload";
    case FrameClass::Keepalive:
        return "keepalive";
    case FrameClass::Accepted:
        return "accepted";
    case FrameClass::Disconnect:
        return "disconnect";
    case FrameClass::Token:
        return "token";
    }
    return "unknown";
}

HeaderParse Header::parse(std::span<const std::byte> bytes, Header &out) noexcept
{
    if (bytes.size() < kHeaderSize)
    {
        return HeaderParse::NeedMore;
    }

    const auto cls = std::to_integer<std::uint8_t>(bytes[0]);
    if (cls > kMaxFrameClass)
    {
        return HeaderParse::Invalid;
    }

    out.frameClass = static_cast<FrameClass>(cls);
    out.sequence = loadU64Be(bytes.data() + 1);
    out.size = loadU16Be(bytes.data() + 9);
    return HeaderParse::Parsed;
}

void Header::encode(std::span<std::byte> out) const noexcept
{
    out[0] = static_cast<std::byte>(frameClass);
    storeU64Be(sequence, out.data() + 1);
    storeU16Be(size, out.data() + 9);
}

} // namespace gamenet::protocol
