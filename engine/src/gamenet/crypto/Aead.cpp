#include <gamenet/crypto/Aead.hpp>

#include <gamenet/protocol/Endian.hpp>

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

namespace gamenet::crypto
{

namespace
{
using Nonce = std::array<unsigned char, kNonceSize>;

Nonce makeNonce(std::uint64_t sequence) noexcept
{
    Nonce nonce{};
    protocol::storeU64Le(sequence, reinterpret_cast<std::byte *>(nonce.data() + 4));
    return nonce;
}

const unsigned char *bytes(std::span<const std::byte> s) noexcept
{
    return reinterpret_cast<const unsigned char *>(s.data());
}

unsigned char *bytes(std::span<std::byte> s) noexcept
{
    return reinterpret_cast<unsigned char *>(s.data());
}

// Final 은 스트림 암호라 아무것도 쓰지 않지만 유효한 포인터는 넘긴다.
unsigned char *finalOut(std::span<std::byte> data, int len, unsigned char *scratch) noexcept
{
    return data.empty() ? scratch : bytes(data) + len;
}
} // namespace

void Aead::CtxDeleter::operator()(EVP_CIPHER_CTX *ctx) const noexcept
{
    ::EVP_CIPHER_CTX_free(ctx);
}

Aead::Aead() : ctx_(::EVP_CIPHER_CTX_new())
{
    if (!ctx_)
    {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
}

Aead::~Aead() = default;

bool Aead::seal(const Key &key, std::uint64_t sequence, std::span<const std::byte> aad,
                std::span<std::byte> data, std::span<std::byte> tag) noexcept
{
    if (tag.size() < kTagSize)
    {
        return false;
    }

    EVP_CIPHER_CTX *ctx = ctx_.get();
    const Nonce nonce = makeNonce(sequence);
    const auto *k = reinterpret_cast<const unsigned char *>(key.data());
    int len = 0;

    if (::EVP_EncryptInit_ex(ctx, ::EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1)
        return false;
    if (::EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(kNonceSize),
                              nullptr) != 1)
        return false;
    if (::EVP_EncryptInit_ex(ctx, nullptr, nullptr, k, nonce.data()) != 1)
        return false;

    if (!aad.empty() &&
        ::EVP_EncryptUpdate(ctx, nullptr, &len, bytes(aad), static_cast<int>(aad.size())) != 1)
        return false;

    if (!data.empty() && ::EVP_EncryptUpdate(ctx, bytes(data), &len, bytes(data),
                                             static_cast<int>(data.size())) != 1)
        return false;

    unsigned char scratch[1];
    int tail = 0;
    if (::EVP_EncryptFinal_ex(ctx, finalOut(data, len, scratch), &tail) != 1)
        return false;

    return ::EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, static_cast<int>(kTagSize),
                                 bytes(tag)) == 1;
}

bool Aead::open(const Key &key, std::uint64_t sequence, std::span<const std::byte> aad,
                std::span<std::byte> data, std::span<const std::byte> tag) noexcept
{
    if (tag.size() < kTagSize)
    {
        return false;
    }

    EVP_CIPHER_CTX *ctx = ctx_.get();
    const Nonce nonce = makeNonce(sequence);
    const auto *k = reinterpret_cast<const unsigned char *>(key.data());
    int len = 0;

    if (::EVP_DecryptInit_ex(ctx, ::EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1)
        return false;
    if (::EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(kNonceSize),
                              nullptr) != 1)
        return false;
    if (::EVP_DecryptInit_ex(ctx, nullptr, nullptr, k, nonce.data()) != 1)
        return false;

    if (!aad.empty() &&
        ::EVP_DecryptUpdate(ctx, nullptr, &len, bytes(aad), static_cast<int>(aad.size())) != 1)
        return false;

    if (!data.empty() && ::EVP_DecryptUpdate(ctx, bytes(data), &len, bytes(data),
                                             static_cast<int>(data.size())) != 1)
        return false;

    // SET_TAG 는 포인터를 non-const 로 받지만 읽기만 한다.
    auto *expected = const_cast<unsigned char *>(bytes(tag));
    if (::EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, static_cast<int>(kTagSize), expected) !=
        1)
        return false;

    unsigned char scratch[1];
    int tail = 0;
    return ::EVP_DecryptFinal_ex(ctx, finalOut(data, len, scratch), &tail) > 0;
}

} // namespace gamenet::crypto
