#pragma once

#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/int.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <optional>
#include <type_traits>

PRELOAD_NAMESPACE_BEGIN

// A trivially copyable value laid out over N consecutive storage slots
// starting at `offset_`.
template <typename T>
    requires std::is_trivially_copyable_v<T>
class StorageVariable
{
public:
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);

    struct Adapter
    {
        union
        {
            struct
            {
                bytes32_t raw[N];

                constexpr bytes32_t &operator[](size_t const i) noexcept
                {
                    return raw[i];
                }

                constexpr bytes32_t const &
                operator[](size_t const i) const noexcept
                {
                    return raw[i];
                }

            } slots;

            T typed;
        };

        Adapter()
            : slots{}
        {
        }

        Adapter(T const &t)
            : slots{}
        {
            typed = t;
        }
    };

private:
    State &state_;
    Address const address_;
    uint256_t const offset_;

    bytes32_t slot_key(size_t const i) const noexcept
    {
        return intx::be::store<bytes32_t>(offset_ + i);
    }

    void store_(Adapter const &adapter)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(address_, slot_key(i), adapter.slots[i]);
        }
    }

    Adapter load_() const noexcept
    {
        Adapter value;
        for (size_t i = 0; i < N; ++i) {
            value.slots[i] = state_.get_storage(address_, slot_key(i));
        }
        return value;
    }

public:
    StorageVariable(State &state, Address const &address, bytes32_t key)
        : state_{state}
        , address_{address}
        , offset_{intx::be::load<uint256_t>(key)}
    {
    }

    StorageVariable(State &state, Address const &address, uint256_t const key)
        : state_{state}
        , address_{address}
        , offset_{key}
    {
    }

    T load() const noexcept
    {
        return load_().typed;
    }

    // Empty when every slot is zero, i.e. the variable was never written or
    // has been cleared.
    std::optional<T> load_checked() const noexcept
    {
        Adapter const value = load_();
        for (size_t i = 0; i < N; ++i) {
            if (value.slots[i] != bytes32_t{}) {
                return value.typed;
            }
        }
        return std::nullopt;
    }

    void store(T const &value)
    {
        Adapter adapter(value);
        store_(adapter);
    }

    T clear()
    {
        auto const res = load();
        store_(Adapter{});
        return res;
    }
};

PRELOAD_NAMESPACE_END
