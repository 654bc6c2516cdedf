#pragma once

#include <preload/core/byte_string.hpp>
#include <preload/core/config.hpp>

#include <evmc/evmc.hpp>

#include <cstring>

PRELOAD_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

using namespace ::evmc::literals;

inline constexpr byte_string_view to_byte_string_view(bytes32_t const &b)
{
    return {b.bytes, sizeof(b.bytes)};
}

// Copies at most 32 bytes of `data` into the start of a word.
inline bytes32_t to_bytes(byte_string_view const data) noexcept
{
    bytes32_t out{};
    std::memcpy(
        out.bytes,
        data.data(),
        data.size() < sizeof(out.bytes) ? data.size() : sizeof(out.bytes));
    return out;
}

PRELOAD_NAMESPACE_END
