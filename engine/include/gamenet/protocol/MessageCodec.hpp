#pragma once

#include <cstddef> // std::byte, std::to_integer
#include <cstdint> // fixed-width ints
#include <cstring> // std::memcpy
#include <span>    // std::span
#include <vector>  // std::vector

#include <gamenet/protocol/Endian.hpp>

namespace gamenet::protocol {

/// 필드 단위 "struct <-> bytes" 변환 유틸.
///
/// ===== 엔디안 규약(고정) =====
/// - 모든 정수 필드는 network byte order(big-endian).
/// - struct 를 통째로 memcpy 하지 않는다(패딩/ABI 의존).
///
/// ByteWriter 는 vector 에 붙여 쓰고(토큰 발급/테스트 등 cold path),
/// SpanWriter 는 미리 확보한 고정 영역에 쓴다(프레임 조립 hot path).
class ByteWriter {
  public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserveBytes) { buf_.reserve(reserveBytes); }

    void clear() noexcept { buf_.clear(); }
    [[nodiscard]] std::size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] bool empty() const noexcept { return buf_.empty(); }
    [[nodiscard]] std::span<const std::byte> view() const noexcept { return buf_; }
    [[nodiscard]] std::vector<std::byte> release() noexcept { return std::move(buf_); }

    void writeU8(std::uint8_t v) { buf_.push_back(static_cast<std::byte>(v)); }

    void writeU16Be(std::uint16_t v)
    {
        std::byte tmp[2];
        storeU16Be(v, tmp);
        buf_.insert(buf_.end(), tmp, tmp + 2);
    }

    void writeU64Be(std::uint64_t v)
    {
        std::byte tmp[8];
        storeU64Be(v, tmp);
        buf_.insert(buf_.end(), tmp, tmp + 8);
    }

    void writeBytes(std::span<const std::byte> bytes)
    {
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
    }

  private:
    std::vector<std::byte> buf_;
};

/// 고정 크기 영역에 순서대로 쓴다. 공간이 모자라면 아무것도 쓰지 않고 false.
class SpanWriter {
  public:
    explicit SpanWriter(std::span<std::byte> out) noexcept : out_(out) {}

    [[nodiscard]] std::size_t offset() const noexcept { return off_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return out_.size() - off_; }

    [[nodiscard]] bool writeU8(std::uint8_t v) noexcept
    {
        if (!ensure_(1))
            return false;
        out_[off_++] = static_cast<std::byte>(v);
        return true;
    }

    [[nodiscard]] bool writeU16Be(std::uint16_t v) noexcept
    {
        if (!ensure_(2))
            return false;
        storeU16Be(v, out_.data() + off_);
        off_ += 2;
        return true;
    }

    [[nodiscard]] bool writeU64Be(std::uint64_t v) noexcept
    {
        if (!ensure_(8))
            return false;
        storeU64Be(v, out_.data() + off_);
        off_ += 8;
        return true;
    }

    [[nodiscard]] bool writeBytes(std::span<const std::byte> bytes) noexcept
    {
        if (!ensure_(bytes.size()))
            return false;
        if (!bytes.empty())
            std::memcpy(out_.data() + off_, bytes.data(), bytes.size());
        off_ += bytes.size();
        return true;
    }

  private:
    std::span<std::byte> out_;
    std::size_t off_{0};

    [[nodiscard]] bool ensure_(std::size_t n) const noexcept { return n <= remaining(); }
};

class ByteReader {
  public:
    explicit ByteReader(std::span<const std::byte> data) noexcept : data_(data) {}

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] std::size_t offset() const noexcept { return off_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - off_; }

    /// 정확히 다 소비했는지(뒤에 쓰레기 바이트가 없는지)
    [[nodiscard]] bool atEnd() const noexcept { return off_ == data_.size(); }

    bool readU8(std::uint8_t &out) noexcept
    {
        if (!ensure_(1))
            return false;
        out = std::to_integer<std::uint8_t>(data_[off_]);
        off_ += 1;
        return true;
    }

    bool readU16Be(std::uint16_t &out) noexcept
    {
        if (!ensure_(2))
            return false;
        out = loadU16Be(data_.data() + off_);
        off_ += 2;
        return true;
    }

    bool readU64Be(std::uint64_t &out) noexcept
    {
        if (!ensure_(8))
            return false;
        out = loadU64Be(data_.data() + off_);
        off_ += 8;
        return true;
    }

    /// out.size() 만큼 복사해서 읽는다.
    bool readBytes(std::span<std::byte> out) noexcept
    {
        if (!ensure_(out.size()))
            return false;
        if (!out.empty())
            std::memcpy(out.data(), data_.data() + off_, out.size());
        off_ += out.size();
        return true;
    }

    /// 복사 없이 view 로 읽는다(원본 수명은 호출자 책임).
    bool readBytesView(std::size_t len, std::span<const std::byte> &out) noexcept
    {
        if (!ensure_(len))
            return false;
        out = data_.subspan(off_, len);
        off_ += len;
        return true;
    }

  private:
    std::span<const std::byte> data_{};
    std::size_t off_{0};

    [[nodiscard]] bool ensure_(std::size_t n) const noexcept { return n <= remaining(); }
};

} // namespace gamenet::protocol
