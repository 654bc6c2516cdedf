#pragma once

#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/likely.h>
#include <preload/core/result.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/big_endian.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstddef>
#include <cstring>
#include <initializer_list>
#include <type_traits>
#include <vector>

PRELOAD_NAMESPACE_BEGIN

enum class AbiDecodeError
{
    Success = 0,
    InputTooShort,
    InvalidPadding,
    InvalidOffset,
    InvalidLength,
};

template <typename T>
concept AbiFixedType = BigEndianType<T> || std::is_same_v<T, Address> ||
                       std::is_same_v<T, bytes32_t>;

// Consumes one head word from the front of `enc`. Integers, addresses and
// bools must be left padded with zeros.
template <AbiFixedType T>
Result<T> abi_decode_fixed(byte_string_view &enc)
{
    if (PRELOAD_UNLIKELY(enc.size() < sizeof(bytes32_t))) {
        return AbiDecodeError::InputTooShort;
    }
    bytes32_t const word = to_bytes(enc.substr(0, sizeof(bytes32_t)));
    enc.remove_prefix(sizeof(bytes32_t));

    if constexpr (std::is_same_v<T, bytes32_t>) {
        return word;
    }
    else {
        constexpr size_t offset = sizeof(bytes32_t) - sizeof(T);
        for (size_t i = 0; i < offset; ++i) {
            if (PRELOAD_UNLIKELY(word.bytes[i] != 0)) {
                return AbiDecodeError::InvalidPadding;
            }
        }
        if constexpr (std::is_same_v<T, bool>) {
            if (PRELOAD_UNLIKELY(word.bytes[offset] > 1)) {
                return AbiDecodeError::InvalidPadding;
            }
            return word.bytes[offset] == 1;
        }
        else {
            T out;
            std::memcpy(&out, &word.bytes[offset], sizeof(T));
            return out;
        }
    }
}

// Reads the arguments of one call, in declaration order. Dynamic arguments
// are followed through their head offset, which is relative to the start of
// the argument tuple.
class AbiDecoder
{
    byte_string_view const data_;
    size_t head_{0};

    Result<size_t> decode_size(size_t pos) const;
    Result<size_t> decode_count(size_t offset, size_t max_count) const;
    Result<byte_string> decode_bytes_at(size_t pos) const;

public:
    explicit AbiDecoder(byte_string_view const data)
        : data_{data}
    {
    }

    template <AbiFixedType T>
    Result<T> read()
    {
        byte_string_view rest = data_.substr(head_);
        auto res = abi_decode_fixed<T>(rest);
        if (res.has_value()) {
            head_ += sizeof(bytes32_t);
        }
        return res;
    }

    Result<byte_string> read_bytes();
    // Arrays longer than max_count fail InvalidLength before any element
    // is read.
    Result<std::vector<byte_string>> read_bytes_array(size_t max_count);
    Result<std::vector<bytes32_t>> read_bytes32_array(size_t max_count);

    // bytes of head consumed so far
    size_t head_size() const noexcept
    {
        return head_;
    }
};

PRELOAD_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<preload::AbiDecodeError>
    : quick_status_code_from_enum_defaults<preload::AbiDecodeError>
{
    static constexpr auto const domain_name = "ABI Decode Error";
    static constexpr auto const domain_uuid =
        "6f0d54a5-2b31-4f58-a7d4-1c3e9a8b2d70";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
