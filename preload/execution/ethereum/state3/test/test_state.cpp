#include <preload/core/bytes.hpp>
#include <preload/core/int.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/receipt.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

using namespace preload;

namespace
{
    constexpr auto a = 0x5353535353535353535353535353535353535353_address;
    constexpr auto b = 0xbebebebebebebebebebebebebebebebebebebebe_address;
    constexpr auto key1 =
        0x00000000000000000000000000000000000000000000000000000000cafebabe_bytes32;
    constexpr auto value1 =
        0x0000000000000013370000000000000000000000000000000000000000000003_bytes32;

    uint256_t balance_of(State const &state, Address const &address)
    {
        return intx::be::load<uint256_t>(state.get_balance(address));
    }
}

TEST(State, balances)
{
    State state{};
    EXPECT_EQ(balance_of(state, a), 0);

    state.add_to_balance(a, 100);
    state.subtract_from_balance(a, 40);
    EXPECT_EQ(balance_of(state, a), 60);
    EXPECT_EQ(balance_of(state, b), 0);
}

TEST(State, zero_storage_is_erased)
{
    State state{};
    EXPECT_EQ(state.get_storage(a, key1), bytes32_t{});

    state.set_storage(a, key1, value1);
    EXPECT_EQ(state.get_storage(a, key1), value1);
    EXPECT_EQ(state.storage_size(a), 1);

    state.set_storage(a, key1, bytes32_t{});
    EXPECT_EQ(state.storage_size(a), 0);
}

TEST(State, reject_restores_everything)
{
    State state{};
    state.add_to_balance(a, 1000);
    state.set_storage(a, key1, value1);
    state.store_log(Receipt::Log{.address = a});

    state.push();
    state.subtract_from_balance(a, 600);
    state.add_to_balance(b, 600);
    state.set_storage(a, key1, bytes32_t{});
    state.set_storage(b, key1, value1);
    state.store_log(Receipt::Log{.address = b});
    EXPECT_EQ(state.logs().size(), 2);
    state.pop_reject();

    EXPECT_EQ(balance_of(state, a), 1000);
    EXPECT_EQ(balance_of(state, b), 0);
    EXPECT_EQ(state.get_storage(a, key1), value1);
    EXPECT_EQ(state.storage_size(b), 0);
    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0].address, a);
    EXPECT_EQ(state.depth(), 0);
}

TEST(State, nested_accept_then_outer_reject)
{
    State state{};
    state.push();
    state.add_to_balance(a, 5);

    state.push();
    state.add_to_balance(a, 7);
    state.set_storage(b, key1, value1);
    state.pop_accept();
    EXPECT_EQ(balance_of(state, a), 12);
    EXPECT_EQ(state.depth(), 1);

    state.pop_reject();
    EXPECT_EQ(balance_of(state, a), 0);
    EXPECT_EQ(state.get_storage(b, key1), bytes32_t{});
}

TEST(State, inner_reject_keeps_outer_changes)
{
    State state{};
    state.push();
    state.add_to_balance(a, 5);
    state.store_log(Receipt::Log{.address = a});

    state.push();
    state.add_to_balance(a, 7);
    state.store_log(Receipt::Log{.address = b});
    state.pop_reject();

    state.pop_accept();
    EXPECT_EQ(balance_of(state, a), 5);
    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0].address, a);
}
