#pragma once

#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/int.hpp>
#include <preload/core/result.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/big_endian.hpp>
#include <preload/execution/ethereum/core/contract/storage_variable.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <evmc/evmc.h>

#include <bit>
#include <cstddef>
#include <cstdint>

PRELOAD_NAMESPACE_BEGIN

inline constexpr Address DEPOSIT_CONTRACT_ADDRESS{
    0x00000000219ab540356cBB839Cbe05303d7705Fa_address};

inline constexpr size_t DEPOSIT_CONTRACT_TREE_DEPTH = 32;
inline constexpr uint64_t MAX_DEPOSIT_COUNT =
    (uint64_t{1} << DEPOSIT_CONTRACT_TREE_DEPTH) - 1;

// hash_tree_root of the SSZ DepositData container
bytes32_t deposit_data_root(
    byte_string_view pubkey, byte_string_view withdrawal_credentials,
    uint64_t amount_gwei, byte_string_view signature);

// Native rendition of the beacon chain deposit contract. Validates each
// deposit, recomputes its DepositData root and appends it to an incremental
// merkle tree of depth 32. BLS signatures are not verified here.
class DepositContract
{
    State &state_;
    Address const ca_;

public:
    class Variables
    {
        State &state_;
        Address const ca_;

        static constexpr auto AddressDepositCount{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

        enum : uint8_t
        {
            PrefixBranch = 0x01,
        };

    public:
        explicit Variables(State &state, Address const &ca)
            : state_{state}
            , ca_{ca}
        {
        }

        StorageVariable<u64_be> deposit_count{
            state_, ca_, AddressDepositCount};

        // bytes32[DEPOSIT_CONTRACT_TREE_DEPTH] branch
        auto branch(uint8_t const height) noexcept
        {
            struct
            {
                uint8_t mask;
                uint8_t height;
                uint8_t slots[30];
            } key{.mask = PrefixBranch, .height = height, .slots = {}};

            return StorageVariable<bytes32_t>(
                state_, ca_, std::bit_cast<bytes32_t>(key));
        }
    } vars;

    explicit DepositContract(
        State &, Address const &ca = DEPOSIT_CONTRACT_ADDRESS);

    Result<void> deposit(
        byte_string_view pubkey, byte_string_view withdrawal_credentials,
        byte_string_view signature, bytes32_t const &deposit_data_root,
        uint256_t const &value);

    bytes32_t get_deposit_root();
    uint64_t get_deposit_count();

private:
    ////////////
    // Events //
    ////////////

    // event DepositEvent(
    //     bytes pubkey,
    //     bytes withdrawal_credentials,
    //     bytes amount,
    //     bytes signature,
    //     bytes index);
    void emit_deposit_event(
        byte_string_view pubkey, byte_string_view withdrawal_credentials,
        uint64_t amount_gwei, byte_string_view signature, uint64_t index);

public:
    using PrecompileFunc = Result<byte_string> (DepositContract::*)(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    /////////////////
    // Precompiles //
    /////////////////
    static PrecompileFunc precompile_dispatch(byte_string_view &);

    Result<byte_string> precompile_deposit(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    Result<byte_string> precompile_get_deposit_root(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    Result<byte_string> precompile_get_deposit_count(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    Result<byte_string> precompile_fallback(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
};

PRELOAD_NAMESPACE_END
