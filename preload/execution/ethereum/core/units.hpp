#pragma once

#include <preload/core/config.hpp>
#include <preload/core/int.hpp>

PRELOAD_NAMESPACE_BEGIN

inline constexpr uint256_t GWEI{1'000'000'000};
inline constexpr uint256_t ETHER{1'000'000'000'000'000'000};

PRELOAD_NAMESPACE_END
