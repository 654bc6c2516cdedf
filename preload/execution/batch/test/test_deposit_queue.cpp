#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/execution/batch/util/batch_error.hpp>
#include <preload/execution/batch/util/constants.hpp>
#include <preload/execution/batch/util/deposit_queue.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace preload;

namespace
{
    constexpr auto SLOT{
        0x01000000000000000000000000000000000000b0b00000000000000000000000_bytes32};

    DepositRecord make_record(uint8_t const seed)
    {
        byte_string const pubkey(PUBKEY_LENGTH, seed);
        byte_string const wc(WITHDRAWAL_CREDENTIALS_LENGTH, 0x01);
        byte_string const sig(SIGNATURE_LENGTH, static_cast<uint8_t>(~seed));
        auto const res =
            make_deposit_record(pubkey, wc, sig, bytes32_t{seed});
        EXPECT_FALSE(res.has_error());
        return res.value();
    }
}

struct DepositQueueTest : public ::testing::Test
{
    State state{};
    DepositQueue queue{state, BATCH_DEPOSIT_CA, SLOT};
};

TEST(DepositRecord, rejects_wrong_lengths)
{
    byte_string const pubkey(PUBKEY_LENGTH, 1);
    byte_string const wc(WITHDRAWAL_CREDENTIALS_LENGTH, 1);
    byte_string const sig(SIGNATURE_LENGTH, 1);

    EXPECT_FALSE(make_deposit_record(pubkey, wc, sig, {}).has_error());

    auto res = make_deposit_record(pubkey.substr(1), wc, sig, {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), BatchDepositError::InvalidArgument);

    res = make_deposit_record(pubkey, wc.substr(1), sig, {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), BatchDepositError::InvalidArgument);

    res = make_deposit_record(pubkey, wc, sig + byte_string(1, 0), {});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), BatchDepositError::InvalidArgument);
}

TEST_F(DepositQueueTest, append_and_read)
{
    EXPECT_TRUE(queue.empty());
    EXPECT_TRUE(queue.records().empty());

    queue.append(make_record(1));
    queue.append(make_record(2));
    EXPECT_EQ(queue.length(), 2);

    auto const records = queue.records();
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0], make_record(1));
    EXPECT_EQ(records[1], make_record(2));

    auto const res = queue.get(2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), BatchDepositError::IndexOutOfRange);
}

TEST_F(DepositQueueTest, set_at)
{
    queue.append(make_record(1));
    queue.append(make_record(2));

    ASSERT_FALSE(queue.set_at(1, make_record(3)).has_error());
    EXPECT_EQ(queue.get(0).value(), make_record(1));
    EXPECT_EQ(queue.get(1).value(), make_record(3));

    auto const res = queue.set_at(2, make_record(4));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), BatchDepositError::IndexOutOfRange);
    EXPECT_EQ(queue.length(), 2);
}

TEST_F(DepositQueueTest, pop_last_n)
{
    for (uint8_t i = 1; i <= 3; ++i) {
        queue.append(make_record(i));
    }

    auto const res = queue.pop_last_n(4);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), BatchDepositError::IndexOutOfRange);

    ASSERT_FALSE(queue.pop_last_n(2).has_error());
    ASSERT_EQ(queue.length(), 1);
    EXPECT_EQ(queue.get(0).value(), make_record(1));

    ASSERT_FALSE(queue.pop_last_n(1).has_error());
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(state.storage_size(BATCH_DEPOSIT_CA), 0);
}

TEST_F(DepositQueueTest, clear_wipes_storage)
{
    queue.append(make_record(1));
    queue.append(make_record(2));
    EXPECT_GT(state.storage_size(BATCH_DEPOSIT_CA), 0);

    EXPECT_EQ(queue.clear(), 2);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(state.storage_size(BATCH_DEPOSIT_CA), 0);

    EXPECT_EQ(queue.clear(), 0);
}

TEST_F(DepositQueueTest, queues_are_independent)
{
    constexpr auto OTHER_SLOT{
        0x01000000000000000000000000000000000000ca110000000000000000000000_bytes32};
    DepositQueue other{state, BATCH_DEPOSIT_CA, OTHER_SLOT};

    queue.append(make_record(1));
    other.append(make_record(2));
    other.append(make_record(3));

    EXPECT_EQ(queue.length(), 1);
    EXPECT_EQ(other.length(), 2);

    other.clear();
    EXPECT_EQ(queue.get(0).value(), make_record(1));
}
