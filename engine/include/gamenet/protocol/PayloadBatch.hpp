#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace gamenet::protocol
{

/// 한 틱 동안 한 클라이언트와 주고받는 게임 메시지 묶음입니다.
///
/// ===== 재사용 규약 =====
/// - 틱마다 새로 만들지 않고 clear() 해서 다시 쓴다. clear() 는 용량을 유지한다.
/// - 클라이언트가 바뀔 때마다 반드시 clear() 해야 이전 클라이언트 데이터가 섞이지 않는다.
///
/// ===== payload body 포맷 =====
/// len:u16 | bytes[len] 이 빈틈없이 이어진다.
class PayloadBatch
{
  public:
    /// 메시지 하나의 최대 길이(u16 length prefix)
    static constexpr std::size_t kMaxMessageSize = 0xFFFF;
    static constexpr std::size_t kLengthPrefixSize = 2;

    PayloadBatch() = default;
    PayloadBatch(std::size_t reserveBytes, std::size_t reserveMessages);

    /// 메시지를 뒤에 복사해 넣는다. kMaxMessageSize 를 넘으면 std::length_error.
    void add(std::span<const std::byte> message);

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size() - head_; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /// 남은 메시지 중 i 번째(앞에서부터). 다음 add() 전까지 유효하다.
    [[nodiscard]] std::span<const std::byte> operator[](std::size_t i) const noexcept;

    void clear() noexcept;

    /// 앞쪽 n 개를 소비된 것으로 표시한다(push 가 프레임에 담은 만큼).
    void dropFront(std::size_t n) noexcept;

    /// 남은 메시지를 앞에서 count 개만 남기고 버린다(pull 실패 시 롤백).
    void truncate(std::size_t count) noexcept;

    /// payload body 를 해석해 메시지들을 뒤에 붙인다.
    /// 형식이 깨져 있으면 false 이며, 이 호출로 붙인 메시지는 되돌린다.
    [[nodiscard]] bool appendFromBody(std::span<const std::byte> body);

    /// payload body 안에서 메시지가 차지하는 크기
    [[nodiscard]] static constexpr std::size_t encodedSize(std::size_t messageLen) noexcept
    {
        return kLengthPrefixSize + messageLen;
    }

  private:
    struct Entry
    {
        std::size_t offset;
        std::size_t length;
    };

    std::vector<std::byte> bytes_;
    std::vector<Entry> entries_;
    std::size_t head_{0};
};

} // namespace gamenet::protocol
