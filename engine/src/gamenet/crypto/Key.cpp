#include <gamenet/crypto/Key.hpp>

#include <gamenet/core/Logger.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <format>
#include <stdexcept>

namespace gamenet::crypto
{

namespace
{
int hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string hexOf(const std::byte *data, std::size_t len)
{
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i)
    {
        out += std::format("{:02x}", std::to_integer<unsigned>(data[i]));
    }
    return out;
}
} // namespace

Key randomKey()
{
    Key key{};
    if (::RAND_bytes(reinterpret_cast<unsigned char *>(key.data()), static_cast<int>(key.size())) !=
        1)
    {
        const unsigned long err = ::ERR_get_error();
        SLOG_ERROR("Crypto", "RandFailed", "err={}", err);
        throw std::runtime_error("RAND_bytes failed");
    }
    return key;
}

SecretKey SecretKey::generate()
{
    return SecretKey{randomKey()};
}

SecretKey SecretKey::fromHex(std::string_view hex)
{
    if (hex.size() != kKeySize * 2)
    {
        throw std::invalid_argument(
            std::format("secret key must be {} hex chars (got {})", kKeySize * 2, hex.size()));
    }

    Key key{};
    for (std::size_t i = 0; i < kKeySize; ++i)
    {
        const int hi = hexValue(hex[2 * i]);
        const int lo = hexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0)
        {
            throw std::invalid_argument(std::format("secret key has non-hex char at {}", 2 * i));
        }
        key[i] = static_cast<std::byte>((hi << 4) | lo);
    }
    return SecretKey{key};
}

std::string SecretKey::fingerprint() const
{
    // 키 바이트가 아니라 SHA-256 다이제스트의 앞 4바이트
    std::array<std::byte, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (::EVP_Digest(key_.data(), key_.size(), reinterpret_cast<unsigned char *>(digest.data()), &len,
                     ::EVP_sha256(), nullptr) != 1 ||
        len < 4)
    {
        const unsigned long err = ::ERR_get_error();
        SLOG_ERROR("Crypto", "DigestFailed", "err={}", err);
        throw std::runtime_error("EVP_Digest failed");
    }
    return hexOf(digest.data(), 4);
}

std::string toHex(const Key &key)
{
    return hexOf(key.data(), key.size());
}

} // namespace gamenet::crypto
