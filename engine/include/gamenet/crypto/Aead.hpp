#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include <gamenet/crypto/Key.hpp>
#include <gamenet/util/NonCopyable.hpp>

typedef struct evp_cipher_ctx_st EVP_CIPHER_CTX;

namespace gamenet::crypto
{

/// ChaCha20-Poly1305 (IETF) in-place AEAD. OpenSSL EVP 컨텍스트 하나를 재사용한다.
///
/// nonce = 0x00000000 | sequence(u64, little-endian)
///
/// 단일 스레드 전용. Endpoint 하나가 Aead 하나를 모든 채널에 빌려준다.
class Aead : private gamenet::util::NonCopyable
{
  public:
    /// 컨텍스트 할당에 실패하면 std::runtime_error.
    Aead();
    ~Aead();

    Aead(Aead &&) noexcept = default;
    Aead &operator=(Aead &&) noexcept = default;

    /// data 를 제자리에서 암호화하고 tag 에 kTagSize 바이트를 쓴다.
    [[nodiscard]] bool seal(const Key &key, std::uint64_t sequence,
                            std::span<const std::byte> aad, std::span<std::byte> data,
                            std::span<std::byte> tag) noexcept;

    /// data 를 제자리에서 복호화한다. 인증에 실패하면 false 이며, data 내용은 믿을 수 없다.
    [[nodiscard]] bool open(const Key &key, std::uint64_t sequence,
                            std::span<const std::byte> aad, std::span<std::byte> data,
                            std::span<const std::byte> tag) noexcept;

  private:
    struct CtxDeleter
    {
        void operator()(EVP_CIPHER_CTX *ctx) const noexcept;
    };

    std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter> ctx_;
};

} // namespace gamenet::crypto
