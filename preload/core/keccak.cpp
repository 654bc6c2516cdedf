#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/keccak.hpp>

#include <ethash/hash_types.hpp>
#include <ethash/keccak.hpp>

#include <bit>

PRELOAD_NAMESPACE_BEGIN

static_assert(sizeof(ethash::hash256) == sizeof(bytes32_t));

bytes32_t keccak256(byte_string_view const data) noexcept
{
    return std::bit_cast<bytes32_t>(
        ethash::keccak256(data.data(), data.size()));
}

PRELOAD_NAMESPACE_END
