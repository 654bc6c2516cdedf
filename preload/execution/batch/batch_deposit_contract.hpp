#pragma once

#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/int.hpp>
#include <preload/core/result.hpp>
#include <preload/execution/batch/deposit_acceptor.hpp>
#include <preload/execution/batch/util/constants.hpp>
#include <preload/execution/batch/util/deposit_queue.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/storage_variable.hpp>

#include <evmc/evmc.h>

#include <bit>
#include <cstdint>
#include <span>
#include <vector>

PRELOAD_NAMESPACE_BEGIN

class State;

// Holds deposit records staged by the owner for each beneficiary. A
// beneficiary consumes its queue by sending exactly COLLATERAL per record
// with empty call data; every record is then forwarded to the bound deposit
// contract.
class BatchDepositContract
{
    State &state_;
    DepositAcceptor &acceptor_;

public:
    BatchDepositContract(State &, DepositAcceptor &);

    class Variables
    {
        State &state_;

        static constexpr auto AddressOwner{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressPaused{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
        static constexpr auto AddressDepositContract{
            0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};

        // Prefixes for mappings
        enum : uint8_t
        {
            PrefixDepositQueue = 0x01,
        };

    public:
        explicit Variables(State &state)
            : state_{state}
        {
        }

        StorageVariable<Address> owner{state_, BATCH_DEPOSIT_CA, AddressOwner};
        StorageVariable<bool> paused{state_, BATCH_DEPOSIT_CA, AddressPaused};
        StorageVariable<Address> deposit_contract{
            state_, BATCH_DEPOSIT_CA, AddressDepositContract};

        // mapping(address => DepositRecord[]) deposit_queue
        DepositQueue deposit_queue(Address const &beneficiary) noexcept
        {
            struct
            {
                uint8_t mask;
                Address beneficiary;
                uint8_t slots[11];
            } key{
                .mask = PrefixDepositQueue,
                .beneficiary = beneficiary,
                .slots = {}};

            static_assert(sizeof(key) == sizeof(bytes32_t));
            return DepositQueue{
                state_, BATCH_DEPOSIT_CA, std::bit_cast<bytes32_t>(key)};
        }
    } vars;

    // Binds the owner and the deposit contract. Runs once, at genesis.
    Result<void>
    initialize(Address const &owner, Address const &deposit_contract);

    ////////////////////
    //  Access Gate  //
    ////////////////////
    Result<void> require_owner(Address const &caller);
    Result<void> when_not_paused();
    Result<void> pause(Address const &caller);
    Result<void> unpause(Address const &caller);
    Result<void>
    transfer_ownership(Address const &caller, Address const &new_owner);
    Result<void> renounce_ownership(Address const &caller);

    //////////////////////
    //  Batch Editing  //
    //////////////////////
    Result<void> add_deposit_data(
        Address const &caller, Address const &beneficiary,
        std::span<byte_string const> pubkeys,
        std::span<byte_string const> withdrawal_credentials,
        std::span<byte_string const> signatures,
        std::span<bytes32_t const> deposit_data_roots);

    Result<void> edit_deposit_data(
        Address const &caller, Address const &beneficiary,
        byte_string_view pubkey, byte_string_view withdrawal_credentials,
        byte_string_view signature, bytes32_t const &deposit_data_root,
        uint256_t const &index);

    Result<void> delete_last_n_deposit_entries(
        Address const &caller, Address const &beneficiary,
        uint256_t const &n);

    Result<void>
    delete_all_entries(Address const &caller, Address const &beneficiary);

    /////////////
    //  Views  //
    /////////////
    std::vector<DepositRecord> get_staker_data(Address const &beneficiary);
    Address owner();
    bool paused();
    Address deposit_contract();

    // Value transfer with empty call data from `sender`.
    Result<void> trigger(Address const &sender, uint256_t const &value);

private:
    ////////////
    // Events //
    ////////////
    void emit_add_deposit_data_event(
        Address const &beneficiary, uint64_t count);
    void emit_edit_deposit_data_event(
        Address const &beneficiary, uint256_t const &index);
    void emit_delete_deposit_data_event(
        Address const &beneficiary, uint256_t const &count);
    void emit_deposited_event(Address const &beneficiary, uint64_t count);
    void emit_deposit_contract_bound_event(Address const &deposit_contract);
    void emit_ownership_transferred_event(
        Address const &previous_owner, Address const &new_owner);
    void emit_paused_event(Address const &account);
    void emit_unpaused_event(Address const &account);

public:
    using PrecompileFunc = Result<byte_string> (BatchDepositContract::*)(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

    /////////////////
    // Precompiles //
    /////////////////
    static PrecompileFunc precompile_dispatch(byte_string_view &);

    Result<byte_string> precompile_receive(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_add_deposit_data(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_edit_deposit_data(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_delete_last_n_deposit_entries(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_delete_all_entries(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_get_staker_data(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_pause(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_unpause(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_transfer_ownership(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_renounce_ownership(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_owner(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_paused(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_deposit_contract(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
    Result<byte_string> precompile_fallback(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
};

PRELOAD_NAMESPACE_END
