#pragma once

#include <preload/core/config.hpp>

#include <concepts>

PRELOAD_NAMESPACE_BEGIN

template <std::unsigned_integral T>
constexpr T round_up(T const x, T const multiple) noexcept
{
    return ((x + multiple - 1) / multiple) * multiple;
}

PRELOAD_NAMESPACE_END
