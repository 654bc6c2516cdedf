#pragma once

#include <preload/core/config.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

PRELOAD_NAMESPACE_BEGIN

using byte_string = std::basic_string<unsigned char>;

using byte_string_view = std::basic_string_view<unsigned char>;

template <size_t N>
using byte_string_fixed = std::array<unsigned char, N>;

template <size_t N>
constexpr byte_string_view to_byte_string_view(byte_string_fixed<N> const &a)
{
    return {a.data(), N};
}

template <size_t N>
constexpr byte_string_view to_byte_string_view(unsigned char const (&a)[N])
{
    return {&a[0], N};
}

inline byte_string_view to_byte_string_view(std::string_view const s)
{
    return {reinterpret_cast<unsigned char const *>(s.data()), s.size()};
}

PRELOAD_NAMESPACE_END
