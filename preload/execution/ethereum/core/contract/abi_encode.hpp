#pragma once

#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/int.hpp>
#include <preload/core/math.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/big_endian.hpp>

#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

PRELOAD_NAMESPACE_BEGIN

// Helpers for encoding types into solidity encoding ABI. This is both for
// events and so return values from contracts can be parsed by solidity
// `abi.decode()`.

//////////////////////////////////////////////////////////////
// Standalone functions for encoding types.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types
//////////////////////////////////////////////////////////////
inline bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    std::memcpy(&output.bytes[12], address.bytes, sizeof(Address));
    return output;
}

template <BigEndianType I>
bytes32_t abi_encode_int(I const &i)
{
    static_assert(sizeof(I) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(I);
    bytes32_t output{};
    std::memcpy(&output.bytes[offset], &i, sizeof(I));
    return output;
}

inline bytes32_t abi_encode_uint(u256_be const &i)
{
    return abi_encode_int(i);
}

inline bytes32_t abi_encode_bool(bool const b)
{
    return abi_encode_int(b);
}

inline byte_string abi_encode_bytes(byte_string_view const input)
{
    byte_string output;
    u256_be const size{input.size()};
    size_t const padding =
        round_up(input.size(), sizeof(bytes32_t)) - input.size();
    output += abi_encode_int(size);
    output += input;
    output.append(padding, 0);
    return output;
}

// bytes[]: element count, then one offset per element (relative to the first
// offset word), then each element encoded as `bytes`.
inline byte_string abi_encode_bytes_array(std::span<byte_string const> items)
{
    byte_string heads;
    byte_string tails;
    for (auto const &item : items) {
        u256_be const offset{items.size() * sizeof(bytes32_t) + tails.size()};
        heads += abi_encode_int(offset);
        tails += abi_encode_bytes(item);
    }
    byte_string output;
    output += abi_encode_int(u256_be{items.size()});
    output += heads;
    output += tails;
    return output;
}

inline byte_string abi_encode_bytes32_array(std::span<bytes32_t const> items)
{
    byte_string output;
    output += abi_encode_int(u256_be{items.size()});
    for (auto const &item : items) {
        output += item;
    }
    return output;
}

// Revert payload understood by every solidity tooling: Error(string)
inline byte_string abi_encode_error_string(std::string_view const message)
{
    static constexpr unsigned char ERROR_SELECTOR[4] = {0x08, 0xc3, 0x79, 0xa0};

    byte_string output(ERROR_SELECTOR, sizeof(ERROR_SELECTOR));
    output += abi_encode_int(u256_be{sizeof(bytes32_t)});
    output += abi_encode_bytes(to_byte_string_view(message));
    return output;
}

// Encodes a tuple
//  * static types : Have size <= 32 are padded out and added to the "head".
//  * dynamic types: size > 32. The "head" stores the offset in the tail, and
//                   the actual data is stored in the tail.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#formal-specification-of-the-encoding
class AbiEncoder
{
    byte_string head_;
    byte_string tail_;
    std::vector<std::pair<size_t, size_t>> unresolved_offsets_;

    void add_static(bytes32_t const &data)
    {
        head_ += data;
    }

    void add_dynamic(byte_string const &data)
    {
        unresolved_offsets_.emplace_back(head_.size(), tail_.size());
        head_ += bytes32_t{};
        tail_ += data;
    }

public:
    void add_address(Address const &address)
    {
        add_static(abi_encode_address(address));
    }

    template <BigEndianType I>
    void add_int(I const &i)
    {
        add_static(abi_encode_int(i));
    }

    void add_bool(bool const b)
    {
        add_static(abi_encode_bool(b));
    }

    void add_bytes32(bytes32_t const &word)
    {
        add_static(word);
    }

    void add_bytes(byte_string_view const data)
    {
        add_dynamic(abi_encode_bytes(data));
    }

    void add_bytes_array(std::span<byte_string const> const items)
    {
        add_dynamic(abi_encode_bytes_array(items));
    }

    void add_bytes32_array(std::span<bytes32_t const> const items)
    {
        add_dynamic(abi_encode_bytes32_array(items));
    }

    byte_string encode_final()
    {
        for (auto const [unresolved, tail_cumsum] : unresolved_offsets_) {
            u256_be offset = static_cast<uint256_t>(head_.size()) + tail_cumsum;
            uint8_t *const p = &head_[unresolved];
            bytes32_t encoded = abi_encode_int(offset);
            std::memcpy(p, encoded.bytes, sizeof(bytes32_t));
        }

        return std::move(head_) + std::move(tail_);
    }
};

PRELOAD_NAMESPACE_END
