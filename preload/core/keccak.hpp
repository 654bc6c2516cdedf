#pragma once

#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>

PRELOAD_NAMESPACE_BEGIN

bytes32_t keccak256(byte_string_view) noexcept;

PRELOAD_NAMESPACE_END
