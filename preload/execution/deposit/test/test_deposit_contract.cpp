#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/int.hpp>
#include <preload/execution/deposit/deposit_contract.hpp>
#include <preload/execution/deposit/deposit_error.hpp>
#include <preload/execution/ethereum/core/contract/abi_encode.hpp>
#include <preload/execution/ethereum/core/contract/abi_signatures.hpp>
#include <preload/execution/ethereum/core/units.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace preload;
using namespace intx;

namespace
{
    byte_string make_pubkey(uint8_t const seed)
    {
        byte_string pubkey(48, seed);
        if (seed == 0) {
            for (size_t i = 0; i < pubkey.size(); ++i) {
                pubkey[i] = static_cast<uint8_t>(i);
            }
        }
        return pubkey;
    }

    byte_string make_withdrawal_credentials()
    {
        byte_string wc(32, 0);
        wc[0] = 0x01;
        for (size_t i = 12; i < 32; ++i) {
            wc[i] = 0xaa;
        }
        return wc;
    }

    byte_string make_signature()
    {
        byte_string sig(96, 0);
        for (size_t i = 0; i < sig.size(); ++i) {
            sig[i] = static_cast<uint8_t>(i);
        }
        return sig;
    }

    constexpr uint64_t DEPOSIT_GWEI = 32'000'000'000;

    constexpr auto ROOT_0{
        0xe3f912a6439c786632997a52376577e9d03840e520295aaf6ef3256e81c23647_bytes32};
    constexpr auto ROOT_42{
        0x8c6e369aa89fffe6c43e36e359736adcd89292d054ea9cea4d75e92726a65669_bytes32};
}

struct DepositContractTest : public ::testing::Test
{
    State state{};
    DepositContract contract{state};

    byte_string const wc = make_withdrawal_credentials();
    byte_string const sig = make_signature();
};

TEST_F(DepositContractTest, data_root)
{
    EXPECT_EQ(
        deposit_data_root(make_pubkey(0), wc, DEPOSIT_GWEI, sig), ROOT_0);
    EXPECT_EQ(
        deposit_data_root(make_pubkey(0x42), wc, DEPOSIT_GWEI, sig), ROOT_42);
    EXPECT_NE(
        deposit_data_root(make_pubkey(0), wc, DEPOSIT_GWEI + 1, sig), ROOT_0);
}

TEST_F(DepositContractTest, empty_tree)
{
    EXPECT_EQ(contract.get_deposit_count(), 0);
    EXPECT_EQ(
        contract.get_deposit_root(),
        0xd70a234731285c6804c2a4f56711ddb8c82c99740f207854891028af34e27e5e_bytes32);
}

TEST_F(DepositContractTest, incremental_root)
{
    uint256_t const value = 32 * ETHER;

    ASSERT_FALSE(
        contract.deposit(make_pubkey(0), wc, sig, ROOT_0, value).has_error());
    EXPECT_EQ(contract.get_deposit_count(), 1);
    EXPECT_EQ(
        contract.get_deposit_root(),
        0x0f61b03af950e965f567f706f4c6580f8c07d605e031b491bc9e008bf7c3e554_bytes32);

    ASSERT_FALSE(
        contract.deposit(make_pubkey(0x42), wc, sig, ROOT_42, value)
            .has_error());
    EXPECT_EQ(
        contract.get_deposit_root(),
        0x57353a03d642046f3d8aef2ef820338cea7088315e9fb3a1ab0ec12b586d13ae_bytes32);

    ASSERT_FALSE(
        contract.deposit(make_pubkey(0), wc, sig, ROOT_0, value).has_error());
    EXPECT_EQ(contract.get_deposit_count(), 3);
    EXPECT_EQ(
        contract.get_deposit_root(),
        0x7f33d6237a12fbdb8a4b5d875d04646bba5f9b292cddf723cbd90fe170011f91_bytes32);
}

TEST_F(DepositContractTest, deposit_event)
{
    ASSERT_FALSE(contract.deposit(make_pubkey(0), wc, sig, ROOT_0, 32 * ETHER)
                     .has_error());

    auto const &logs = state.logs();
    ASSERT_EQ(logs.size(), 1);
    EXPECT_EQ(logs[0].address, DEPOSIT_CONTRACT_ADDRESS);
    ASSERT_EQ(logs[0].topics.size(), 1);
    EXPECT_EQ(
        logs[0].topics[0],
        abi_encode_event_signature(
            "DepositEvent(bytes,bytes,bytes,bytes,bytes)"));

    byte_string const amount{
        0x00, 0x40, 0x59, 0x73, 0x07, 0x00, 0x00, 0x00};
    byte_string const index(8, 0);

    AbiEncoder encoder;
    encoder.add_bytes(make_pubkey(0));
    encoder.add_bytes(wc);
    encoder.add_bytes(amount);
    encoder.add_bytes(sig);
    encoder.add_bytes(index);
    EXPECT_EQ(logs[0].data, encoder.encode_final());
}

TEST_F(DepositContractTest, rejects_bad_lengths)
{
    uint256_t const value = 32 * ETHER;
    auto const pubkey = make_pubkey(0);

    auto res = contract.deposit(pubkey.substr(0, 47), wc, sig, ROOT_0, value);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DepositError::InvalidPubkeyLength);

    res = contract.deposit(pubkey, wc + byte_string(1, 0), sig, ROOT_0, value);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DepositError::InvalidWithdrawalCredentialsLength);

    res = contract.deposit(pubkey, wc, sig.substr(1), ROOT_0, value);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DepositError::InvalidSignatureLength);

    EXPECT_EQ(contract.get_deposit_count(), 0);
    EXPECT_TRUE(state.logs().empty());
}

TEST_F(DepositContractTest, rejects_bad_values)
{
    auto const pubkey = make_pubkey(0);

    auto res = contract.deposit(pubkey, wc, sig, ROOT_0, ETHER - GWEI);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DepositError::DepositValueTooLow);

    res = contract.deposit(pubkey, wc, sig, ROOT_0, 32 * ETHER + 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DepositError::DepositValueNotMultipleOfGwei);

    uint256_t const too_high =
        (uint256_t{std::numeric_limits<uint64_t>::max()} + 1) * GWEI;
    res = contract.deposit(pubkey, wc, sig, ROOT_0, too_high);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DepositError::DepositValueTooHigh);

    // root was computed for 32 ether
    res = contract.deposit(pubkey, wc, sig, ROOT_0, 31 * ETHER);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DepositError::DepositDataRootMismatch);

    EXPECT_EQ(contract.get_deposit_count(), 0);
}

TEST_F(DepositContractTest, precompile_deposit)
{
    AbiEncoder encoder;
    encoder.add_bytes(make_pubkey(0));
    encoder.add_bytes(wc);
    encoder.add_bytes(sig);
    encoder.add_bytes32(ROOT_0);
    byte_string input{0x22, 0x89, 0x51, 0x18};
    input += encoder.encode_final();

    byte_string_view view{input};
    auto const func = DepositContract::precompile_dispatch(view);
    EXPECT_EQ(func, &DepositContract::precompile_deposit);

    auto const value = intx::be::store<evmc_bytes32>(uint256_t{32 * ETHER});
    auto const res = (contract.*func)(view, evmc_address{}, value);
    ASSERT_FALSE(res.has_error());
    EXPECT_TRUE(res.value().empty());
    EXPECT_EQ(contract.get_deposit_count(), 1);
}

TEST_F(DepositContractTest, precompile_views)
{
    ASSERT_FALSE(contract.deposit(make_pubkey(0), wc, sig, ROOT_0, 32 * ETHER)
                     .has_error());

    byte_string const root_call{0xc5, 0xf2, 0x89, 0x2f};
    byte_string_view view{root_call};
    auto func = DepositContract::precompile_dispatch(view);
    EXPECT_EQ(func, &DepositContract::precompile_get_deposit_root);
    auto res = (contract.*func)(view, evmc_address{}, evmc_bytes32{});
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(
        res.value(),
        byte_string{to_byte_string_view(contract.get_deposit_root())});

    byte_string const count_call{0x62, 0x1f, 0xd1, 0x30};
    view = count_call;
    func = DepositContract::precompile_dispatch(view);
    EXPECT_EQ(func, &DepositContract::precompile_get_deposit_count);
    res = (contract.*func)(view, evmc_address{}, evmc_bytes32{});
    ASSERT_FALSE(res.has_error());

    byte_string const count{0x01, 0, 0, 0, 0, 0, 0, 0};
    AbiEncoder encoder;
    encoder.add_bytes(count);
    EXPECT_EQ(res.value(), encoder.encode_final());

    // views are not payable
    view = count_call;
    func = DepositContract::precompile_dispatch(view);
    res = (contract.*func)(view, evmc_address{}, evmc_bytes32{1});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DepositError::ValueNonZero);
}

TEST_F(DepositContractTest, unknown_selector)
{
    byte_string const input{0xde, 0xad, 0xbe, 0xef};
    byte_string_view view{input};
    auto const func = DepositContract::precompile_dispatch(view);
    EXPECT_EQ(func, &DepositContract::precompile_fallback);
    auto const res = (contract.*func)(view, evmc_address{}, evmc_bytes32{});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), DepositError::MethodNotSupported);
}
