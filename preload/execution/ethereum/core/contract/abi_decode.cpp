#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/likely.h>
#include <preload/core/math.hpp>
#include <preload/core/result.hpp>
#include <preload/execution/ethereum/core/contract/abi_decode.hpp>
#include <preload/execution/ethereum/core/contract/big_endian.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

PRELOAD_NAMESPACE_BEGIN

// A length or offset word. Anything that does not fit in the call data
// cannot be valid, which also rules out overflow in the arithmetic below.
Result<size_t> AbiDecoder::decode_size(size_t const pos) const
{
    if (PRELOAD_UNLIKELY(
            pos > data_.size() || data_.size() - pos < sizeof(bytes32_t))) {
        return AbiDecodeError::InputTooShort;
    }
    byte_string_view word = data_.substr(pos, sizeof(bytes32_t));
    auto const value = BOOST_OUTCOME_TRYX(abi_decode_fixed<u64_be>(word));
    if (PRELOAD_UNLIKELY(value.native() > data_.size())) {
        return AbiDecodeError::InvalidOffset;
    }
    return static_cast<size_t>(value.native());
}

Result<byte_string> AbiDecoder::decode_bytes_at(size_t const pos) const
{
    auto const length = BOOST_OUTCOME_TRYX(decode_size(pos));
    size_t const start = pos + sizeof(bytes32_t);
    size_t const padded = round_up(length, sizeof(bytes32_t));
    if (PRELOAD_UNLIKELY(data_.size() - start < padded)) {
        return AbiDecodeError::InvalidLength;
    }
    return byte_string{data_.substr(start, length)};
}

Result<byte_string> AbiDecoder::read_bytes()
{
    auto const offset = BOOST_OUTCOME_TRYX(decode_size(head_));
    auto bytes = BOOST_OUTCOME_TRYX(decode_bytes_at(offset));
    head_ += sizeof(bytes32_t);
    return bytes;
}

Result<size_t>
AbiDecoder::decode_count(size_t const offset, size_t const max_count) const
{
    auto const count = BOOST_OUTCOME_TRYX(decode_size(offset));
    size_t const base = offset + sizeof(bytes32_t);
    if (PRELOAD_UNLIKELY(
            count > max_count ||
            (data_.size() - base) / sizeof(bytes32_t) < count)) {
        return AbiDecodeError::InvalidLength;
    }
    return count;
}

// Element tails must follow the element heads in order without overlapping,
// so the elements copied out never add up to more than the call data.
Result<std::vector<byte_string>>
AbiDecoder::read_bytes_array(size_t const max_count)
{
    auto const offset = BOOST_OUTCOME_TRYX(decode_size(head_));
    auto const count = BOOST_OUTCOME_TRYX(decode_count(offset, max_count));
    size_t const base = offset + sizeof(bytes32_t);

    std::vector<byte_string> items;
    items.reserve(count);
    size_t next_tail = count * sizeof(bytes32_t);
    for (size_t i = 0; i < count; ++i) {
        auto const item_offset =
            BOOST_OUTCOME_TRYX(decode_size(base + i * sizeof(bytes32_t)));
        if (PRELOAD_UNLIKELY(
                item_offset < next_tail ||
                item_offset > data_.size() - base)) {
            return AbiDecodeError::InvalidOffset;
        }
        auto item = BOOST_OUTCOME_TRYX(decode_bytes_at(base + item_offset));
        next_tail = item_offset + sizeof(bytes32_t) +
                    round_up(item.size(), sizeof(bytes32_t));
        items.push_back(std::move(item));
    }
    head_ += sizeof(bytes32_t);
    return items;
}

Result<std::vector<bytes32_t>>
AbiDecoder::read_bytes32_array(size_t const max_count)
{
    auto const offset = BOOST_OUTCOME_TRYX(decode_size(head_));
    auto const count = BOOST_OUTCOME_TRYX(decode_count(offset, max_count));
    size_t const base = offset + sizeof(bytes32_t);

    std::vector<bytes32_t> items;
    items.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        items.push_back(to_bytes(
            data_.substr(base + i * sizeof(bytes32_t), sizeof(bytes32_t))));
    }
    head_ += sizeof(bytes32_t);
    return items;
}

PRELOAD_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<preload::AbiDecodeError>::mapping> const &
quick_status_code_from_enum<preload::AbiDecodeError>::value_mappings()
{
    using preload::AbiDecodeError;

    static std::initializer_list<mapping> const v = {
        {AbiDecodeError::Success, "success", {errc::success}},
        {AbiDecodeError::InputTooShort, "abi input too short", {}},
        {AbiDecodeError::InvalidPadding, "abi word not canonical", {}},
        {AbiDecodeError::InvalidOffset, "abi offset out of bounds", {}},
        {AbiDecodeError::InvalidLength, "abi length out of bounds", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
