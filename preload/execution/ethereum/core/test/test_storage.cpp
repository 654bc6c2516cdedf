#include <preload/core/bytes.hpp>
#include <preload/core/int.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/big_endian.hpp>
#include <preload/execution/ethereum/core/contract/storage_array.hpp>
#include <preload/execution/ethereum/core/contract/storage_variable.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <bit>
#include <cstdint>

using namespace preload;

struct Storage : public ::testing::Test
{
    static constexpr auto ADDRESS{
        0x36928500bc1dcd7af6a2b4008875cc336b927d57_address};
    State state{};
};

TEST_F(Storage, big_endian)
{
    bytes32_t y{5};
    u256_be be = std::bit_cast<u256_be>(y);
    be = be.native() + 5;
    EXPECT_EQ(std::bit_cast<bytes32_t>(be), bytes32_t{10});
    EXPECT_EQ(u256_be::from_bytes(bytes32_t{10}), be);
    EXPECT_FALSE(be.is_zero());
    EXPECT_TRUE(u64_be{0}.is_zero());
}

TEST_F(Storage, variable)
{
    StorageVariable<uint256_t> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());
    var.store(5);
    ASSERT_TRUE(var.load_checked().has_value());
    EXPECT_EQ(var.load(), 5);
    var.store(2000);
    EXPECT_EQ(var.load(), 2000);
    EXPECT_EQ(var.clear(), 2000);
    EXPECT_FALSE(var.load_checked().has_value());
    EXPECT_EQ(state.storage_size(ADDRESS), 0);
}

TEST_F(Storage, multi_slot_struct)
{
    struct S
    {
        u64_be x;
        uint8_t tag[40];
        u256_be z;
    };

    static_assert(StorageVariable<S>::N == 3);

    StorageVariable<S> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());

    S s{};
    s.x = 4;
    s.tag[39] = 0xff;
    s.z = 6;
    var.store(s);
    EXPECT_EQ(state.storage_size(ADDRESS), 3);

    S const loaded = var.load();
    EXPECT_EQ(loaded.x.native(), 4);
    EXPECT_EQ(loaded.tag[39], 0xff);
    EXPECT_EQ(loaded.z.native(), 6);

    var.clear();
    EXPECT_FALSE(var.load_checked());
    EXPECT_EQ(state.storage_size(ADDRESS), 0);
}

TEST_F(Storage, array)
{
    struct SomeType
    {
        u256_be blob;
        u32_be counter;
    };

    StorageArray<SomeType> arr(state, ADDRESS, bytes32_t{100});
    EXPECT_TRUE(arr.empty());

    for (uint32_t i = 0; i < 100; ++i) {
        arr.push(SomeType{.blob = uint256_t{2000}, .counter = i});
        EXPECT_EQ(arr.length(), i + 1);
    }

    for (uint32_t i = 0; i < 100; ++i) {
        auto const res = arr.get(i);
        ASSERT_TRUE(res.load_checked().has_value())
            << "Could not load at index: " << i << std::endl;
        EXPECT_EQ(res.load().counter.native(), i);
    }

    for (uint32_t i = 100; i > 0; --i) {
        EXPECT_EQ(arr.pop().counter.native(), i - 1);
        EXPECT_EQ(arr.length(), i - 1);
    }
    EXPECT_EQ(state.storage_size(ADDRESS), 0);
}

TEST_F(Storage, pop_empty_array)
{
    StorageArray<u64_be> arr(state, ADDRESS, bytes32_t{100});
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(arr.length(), 0);
        EXPECT_TRUE(arr.pop().is_zero());
    }
}

TEST_F(Storage, truncate)
{
    StorageArray<u64_be> arr(state, ADDRESS, bytes32_t{100});
    for (uint64_t i = 1; i <= 10; ++i) {
        arr.push(i);
    }

    arr.truncate(4);
    EXPECT_EQ(arr.length(), 4);
    EXPECT_EQ(arr.get(3).load().native(), 4);
    EXPECT_FALSE(arr.get(4).load_checked().has_value());

    // a push after truncation reuses the freed slot
    arr.push(uint64_t{42});
    EXPECT_EQ(arr.get(4).load().native(), 42);

    arr.clear();
    EXPECT_TRUE(arr.empty());
    EXPECT_EQ(state.storage_size(ADDRESS), 0);
}

TEST_F(Storage, rejected_frame_restores_storage)
{
    StorageArray<u64_be> arr(state, ADDRESS, bytes32_t{100});
    arr.push(uint64_t{1});

    state.push();
    arr.push(uint64_t{2});
    arr.get(0).store(uint64_t{7});
    state.pop_reject();

    EXPECT_EQ(arr.length(), 1);
    EXPECT_EQ(arr.get(0).load().native(), 1);
    EXPECT_EQ(state.storage_size(ADDRESS), 2);
}

TEST_F(Storage, partial_slot)
{
    StorageVariable<u64_be>::Adapter adapter(u64_be{0xABCD});
    bytes32_t expected{};
    expected.bytes[6] = 0xAB;
    expected.bytes[7] = 0xCD;
    EXPECT_EQ(adapter.slots[0], expected);
}
