#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/sha256.hpp>

#include <openssl/sha.h>

#include <cstring>

PRELOAD_NAMESPACE_BEGIN

static_assert(SHA256_DIGEST_LENGTH == sizeof(bytes32_t));

bytes32_t sha256(byte_string_view const data) noexcept
{
    bytes32_t out;
    SHA256(data.data(), data.size(), out.bytes);
    return out;
}

bytes32_t sha256(bytes32_t const &left, bytes32_t const &right) noexcept
{
    unsigned char buf[2 * sizeof(bytes32_t)];
    std::memcpy(buf, left.bytes, sizeof(bytes32_t));
    std::memcpy(buf + sizeof(bytes32_t), right.bytes, sizeof(bytes32_t));
    return sha256(byte_string_view{buf, sizeof(buf)});
}

PRELOAD_NAMESPACE_END
