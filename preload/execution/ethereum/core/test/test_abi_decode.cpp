#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/abi_decode.hpp>
#include <preload/execution/ethereum/core/contract/abi_encode.hpp>
#include <preload/execution/ethereum/core/contract/big_endian.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace preload;

TEST(AbiDecode, fixed_consumes_one_word)
{
    byte_string input;
    input += abi_encode_uint(u256_be{32});
    input += abi_encode_address(Address{0xabcd});

    byte_string_view view{input};
    auto const value = abi_decode_fixed<u256_be>(view);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value().native(), 32);
    EXPECT_EQ(view.size(), 32);

    auto const address = abi_decode_fixed<Address>(view);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address.value(), Address{0xabcd});
    EXPECT_TRUE(view.empty());

    auto const eof = abi_decode_fixed<bytes32_t>(view);
    ASSERT_TRUE(eof.has_error());
    EXPECT_EQ(eof.error(), AbiDecodeError::InputTooShort);
}

TEST(AbiDecode, dirty_address_rejected)
{
    bytes32_t word = abi_encode_address(Address{0xabcd});
    word.bytes[0] = 0x01;
    byte_string const input{to_byte_string_view(word)};

    byte_string_view view{input};
    auto const res = abi_decode_fixed<Address>(view);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AbiDecodeError::InvalidPadding);
}

TEST(AbiDecode, bool)
{
    byte_string input;
    input += abi_encode_bool(true);
    input += bytes32_t{2};

    byte_string_view view{input};
    auto const yes = abi_decode_fixed<bool>(view);
    ASSERT_TRUE(yes.has_value());
    EXPECT_TRUE(yes.value());
    EXPECT_TRUE(abi_decode_fixed<bool>(view).has_error());
}

TEST(AbiDecode, call_arguments)
{
    std::vector<byte_string> const pubkeys{
        byte_string(48, 0x11), byte_string(48, 0x22)};
    std::vector<bytes32_t> const roots{bytes32_t{1}, bytes32_t{2}};

    AbiEncoder encoder;
    encoder.add_address(Address{0x77});
    encoder.add_bytes_array(pubkeys);
    encoder.add_bytes(byte_string(96, 0x33));
    encoder.add_bytes32_array(roots);
    encoder.add_int(u256_be{5});
    auto const input = encoder.encode_final();

    AbiDecoder decoder{input};
    auto const beneficiary = decoder.read<Address>();
    ASSERT_TRUE(beneficiary.has_value());
    EXPECT_EQ(beneficiary.value(), Address{0x77});

    auto const decoded_pubkeys = decoder.read_bytes_array(16);
    ASSERT_TRUE(decoded_pubkeys.has_value());
    EXPECT_EQ(decoded_pubkeys.value(), pubkeys);

    auto const signature = decoder.read_bytes();
    ASSERT_TRUE(signature.has_value());
    EXPECT_EQ(signature.value(), byte_string(96, 0x33));

    auto const decoded_roots = decoder.read_bytes32_array(16);
    ASSERT_TRUE(decoded_roots.has_value());
    EXPECT_EQ(decoded_roots.value(), roots);

    auto const index = decoder.read<u256_be>();
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(index.value().native(), 5);
    EXPECT_EQ(decoder.head_size(), 5 * 32);
}

TEST(AbiDecode, offset_out_of_bounds)
{
    byte_string input;
    input += abi_encode_uint(u256_be{0x1000});

    AbiDecoder decoder{input};
    auto const res = decoder.read_bytes();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AbiDecodeError::InvalidOffset);
}

TEST(AbiDecode, huge_offset)
{
    byte_string input;
    input += bytes32_t{~uint64_t{0}};
    input[0] = 0x80;

    AbiDecoder decoder{input};
    auto const res = decoder.read_bytes_array(16);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AbiDecodeError::InvalidPadding);
}

TEST(AbiDecode, length_past_end)
{
    // offset 0x20, length 0x40, but only one word of payload
    byte_string input;
    input += abi_encode_uint(u256_be{0x20});
    input += abi_encode_uint(u256_be{0x40});
    input += bytes32_t{};

    AbiDecoder decoder{input};
    auto const res = decoder.read_bytes();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AbiDecodeError::InvalidLength);
}

TEST(AbiDecode, array_count_past_end)
{
    byte_string input;
    input += abi_encode_uint(u256_be{0x20});
    input += abi_encode_uint(u256_be{0x40});

    AbiDecoder decoder{input};
    auto const res = decoder.read_bytes32_array(16);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AbiDecodeError::InvalidLength);
}

TEST(AbiDecode, array_count_above_limit)
{
    std::vector<bytes32_t> const roots(3, bytes32_t{7});
    AbiEncoder encoder;
    encoder.add_bytes32_array(roots);
    auto const input = encoder.encode_final();

    AbiDecoder capped{input};
    auto const res = capped.read_bytes32_array(2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AbiDecodeError::InvalidLength);

    AbiDecoder decoder{input};
    auto const decoded = decoder.read_bytes32_array(3);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), roots);
}

TEST(AbiDecode, aliased_elements_rejected)
{
    // bytes[] whose element heads all point at one shared tail
    constexpr size_t count = 4;
    byte_string input;
    input += abi_encode_uint(u256_be{0x20});
    input += abi_encode_uint(u256_be{count});
    for (size_t i = 0; i < count; ++i) {
        input += abi_encode_uint(u256_be{count * 32});
    }
    input += abi_encode_uint(u256_be{64});
    input += byte_string(64, 0xee);

    AbiDecoder decoder{input};
    auto const res = decoder.read_bytes_array(count);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AbiDecodeError::InvalidOffset);
}

TEST(AbiDecode, element_tail_inside_heads_rejected)
{
    byte_string input;
    input += abi_encode_uint(u256_be{0x20});
    input += abi_encode_uint(u256_be{2});
    input += abi_encode_uint(u256_be{0x20});
    input += abi_encode_uint(u256_be{0x40});
    input += abi_encode_uint(u256_be{0});

    AbiDecoder decoder{input};
    auto const res = decoder.read_bytes_array(2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AbiDecodeError::InvalidOffset);
}
