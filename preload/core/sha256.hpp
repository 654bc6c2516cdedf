#pragma once

#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>

PRELOAD_NAMESPACE_BEGIN

bytes32_t sha256(byte_string_view) noexcept;

// sha256(left || right), the inner node of every SSZ merkleization
bytes32_t sha256(bytes32_t const &left, bytes32_t const &right) noexcept;

PRELOAD_NAMESPACE_END
