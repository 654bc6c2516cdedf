#pragma once

#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/int.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <cstring>
#include <type_traits>

PRELOAD_NAMESPACE_BEGIN

// Integer stored in network byte order, so a packed struct of these has the
// same layout in contract storage as the solidity equivalent.
template <typename T>
    requires(std::is_integral_v<T> || std::is_same_v<T, uint256_t>)
struct BigEndian
{
    unsigned char bytes[sizeof(T)];

    BigEndian() = default;

    BigEndian(T const &x) noexcept
    {
        intx::be::store(bytes, x);
    }

    static BigEndian<T> from_bytes(bytes32_t const &word) noexcept
        requires(sizeof(T) == sizeof(bytes32_t))
    {
        BigEndian<T> out;
        std::memcpy(out.bytes, word.bytes, sizeof(T));
        return out;
    }

    bool operator==(BigEndian<T> const &other) const noexcept
    {
        return 0 == std::memcmp(bytes, other.bytes, sizeof(T));
    }

    bool is_zero() const noexcept
    {
        return *this == BigEndian<T>{T{0}};
    }

    T native() const noexcept
    {
        return intx::be::load<T>(bytes);
    }

    BigEndian<T> &operator=(T const &x) noexcept
    {
        intx::be::store(bytes, x);
        return *this;
    }
};

using u16_be = BigEndian<uint16_t>;
using u32_be = BigEndian<uint32_t>;
using u64_be = BigEndian<uint64_t>;
using u256_be = BigEndian<uint256_t>;
static_assert(sizeof(u16_be) == sizeof(uint16_t));
static_assert(sizeof(u32_be) == sizeof(uint32_t));
static_assert(sizeof(u64_be) == sizeof(uint64_t));
static_assert(sizeof(u256_be) == sizeof(uint256_t));
static_assert(std::is_trivially_copyable_v<u256_be>);

template <typename T>
struct is_big_endian_wrapper : std::false_type
{
};

template <>
struct is_big_endian_wrapper<uint8_t> : std::true_type
{
};

template <>
struct is_big_endian_wrapper<bool> : std::true_type
{
};

template <typename U>
struct is_big_endian_wrapper<BigEndian<U>> : std::true_type
{
};

template <typename T>
concept BigEndianType = is_big_endian_wrapper<T>::value;

PRELOAD_NAMESPACE_END
