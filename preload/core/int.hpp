#pragma once

#include <preload/core/config.hpp>

#include <intx/intx.hpp>

PRELOAD_NAMESPACE_BEGIN

using uint128_t = ::intx::uint128;
using uint256_t = ::intx::uint256;

static_assert(sizeof(uint256_t) == 32);

PRELOAD_NAMESPACE_END
