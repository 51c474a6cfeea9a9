#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace gamenet::crypto
{

inline constexpr std::size_t kKeySize = 32;   ///< ChaCha20-Poly1305 key
inline constexpr std::size_t kNonceSize = 12; ///< IETF nonce
inline constexpr std::size_t kTagSize = 16;   ///< Poly1305 tag

using Key = std::array<std::byte, kKeySize>;

/// CSPRNG 로 새 키를 만든다. 난수원이 실패하면 std::runtime_error.
[[nodiscard]] Key randomKey();

/// 프로세스 전역 비밀 키. 토큰 프레임의 암호화/복호화에 쓰인다.
///
/// - 생성 후 바뀌지 않는다.
/// - 로그에는 fingerprint() 만 남긴다. 키 바이트는 절대 출력하지 않는다.
class SecretKey
{
  public:
    explicit SecretKey(const Key &key) noexcept : key_(key) {}

    /// 새 랜덤 키
    [[nodiscard]] static SecretKey generate();

    /// 64자리 hex 문자열에서 읽는다. 형식이 틀리면 std::invalid_argument.
    [[nodiscard]] static SecretKey fromHex(std::string_view hex);

    [[nodiscard]] const Key &key() const noexcept { return key_; }

    /// 키의 SHA-256 앞 4바이트 hex. 어떤 키로 떴는지 로그로 구분하는 용도.
    /// 다이제스트 계산이 실패하면 std::runtime_error.
    [[nodiscard]] std::string fingerprint() const;

  private:
    Key key_;
};

/// 키를 64자리 소문자 hex 로 바꾼다(설정 파일 작성/테스트용).
[[nodiscard]] std::string toHex(const Key &key);

} // namespace gamenet::crypto
