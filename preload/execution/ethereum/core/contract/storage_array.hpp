#pragma once

#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/int.hpp>
#include <preload/core/likely.h>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/big_endian.hpp>
#include <preload/execution/ethereum/core/contract/storage_variable.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <type_traits>

PRELOAD_NAMESPACE_BEGIN

// Dynamic array in contract storage: the length lives in the base slot and
// element i occupies the SLOT_PER_ELEM slots starting at
// base + 1 + i * SLOT_PER_ELEM.
template <typename T>
    requires std::is_trivially_copyable_v<T>
class StorageArray
{
    State &state_;
    Address const address_;
    StorageVariable<u64_be> length_;
    uint256_t const start_index_;

    StorageVariable<T> element(uint64_t const index) const noexcept
    {
        uint256_t const offset = start_index_ + index * SLOT_PER_ELEM;
        return StorageVariable<T>{
            state_, address_, intx::be::store<bytes32_t>(offset)};
    }

public:
    static constexpr uint64_t SLOT_PER_ELEM = StorageVariable<T>::N;

    StorageArray(State &state, Address const &address, bytes32_t const &slot)
        : state_{state}
        , address_{address}
        , length_{state, address, slot}
        , start_index_{intx::be::load<uint256_t>(slot) + 1}
    {
    }

    uint64_t length() const noexcept
    {
        return length_.load().native();
    }

    bool empty() const noexcept
    {
        return length() == 0;
    }

    // Caller checks index < length()
    StorageVariable<T> get(uint64_t const index) const noexcept
    {
        return element(index);
    }

    void push(T const &value)
    {
        auto const len = length();
        element(len).store(value);
        length_.store(len + 1);
    }

    T pop()
    {
        T value{};
        auto len = length();
        if (PRELOAD_LIKELY(len > 0)) {
            len = len - 1;
            value = element(len).clear();
            length_.store(len);
        }
        return value;
    }

    // Zeroes every element slot past new_length so no stale record can
    // resurface on a later push.
    void truncate(uint64_t const new_length)
    {
        auto len = length();
        while (len > new_length) {
            --len;
            element(len).clear();
        }
        length_.store(len);
    }

    void clear()
    {
        truncate(0);
    }
};

PRELOAD_NAMESPACE_END
