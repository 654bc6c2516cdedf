#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/fmt/address_fmt.hpp>
#include <preload/core/int.hpp>
#include <preload/core/likely.h>
#include <preload/core/result.hpp>
#include <preload/execution/batch/batch_deposit_contract.hpp>
#include <preload/execution/batch/util/batch_error.hpp>
#include <preload/execution/batch/util/constants.hpp>
#include <preload/execution/batch/util/deposit_queue.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/abi_decode.hpp>
#include <preload/execution/ethereum/core/contract/abi_encode.hpp>
#include <preload/execution/ethereum/core/contract/abi_signatures.hpp>
#include <preload/execution/ethereum/core/contract/big_endian.hpp>
#include <preload/execution/ethereum/core/contract/events.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.h>
#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <vector>

PRELOAD_ANONYMOUS_NAMESPACE_BEGIN

////////////////////////
// Function Selectors //
////////////////////////

struct PrecompileSelector
{
    static constexpr uint32_t ADD_DEPOSIT_DATA = abi_encode_selector(
        "addDepositData(address,bytes[],bytes[],bytes[],bytes32[])");
    static constexpr uint32_t EDIT_DEPOSIT_DATA = abi_encode_selector(
        "editDepositData(address,bytes,bytes,bytes,bytes32,uint256)");
    static constexpr uint32_t DELETE_LAST_N_DEPOSIT_ENTRIES =
        abi_encode_selector("deleteLastnDepositEntries(address,uint256)");
    static constexpr uint32_t DELETE_ALL_ENTRIES =
        abi_encode_selector("deleteAllEntries(address)");
    static constexpr uint32_t GET_STAKER_DATA =
        abi_encode_selector("getStakerData(address)");
    static constexpr uint32_t PAUSE = abi_encode_selector("pause()");
    static constexpr uint32_t UNPAUSE = abi_encode_selector("unpause()");
    static constexpr uint32_t TRANSFER_OWNERSHIP =
        abi_encode_selector("transferOwnership(address)");
    static constexpr uint32_t RENOUNCE_OWNERSHIP =
        abi_encode_selector("renounceOwnership()");
    static constexpr uint32_t OWNER = abi_encode_selector("owner()");
    static constexpr uint32_t PAUSED = abi_encode_selector("paused()");
    static constexpr uint32_t DEPOSIT_CONTRACT =
        abi_encode_selector("depositContract()");
};

static_assert(PrecompileSelector::ADD_DEPOSIT_DATA == 0x04528eb4);
static_assert(PrecompileSelector::EDIT_DEPOSIT_DATA == 0x8a94a601);
static_assert(PrecompileSelector::DELETE_LAST_N_DEPOSIT_ENTRIES == 0x6108083a);
static_assert(PrecompileSelector::DELETE_ALL_ENTRIES == 0x044a07cc);
static_assert(PrecompileSelector::GET_STAKER_DATA == 0xc601f352);

Result<void> function_not_payable(evmc_uint256be const &value)
{
    if (PRELOAD_UNLIKELY(!u256_be::from_bytes(value).is_zero())) {
        return BatchDepositError::ValueNonZero;
    }

    return outcome::success();
}

PRELOAD_ANONYMOUS_NAMESPACE_END

PRELOAD_NAMESPACE_BEGIN

BatchDepositContract::BatchDepositContract(
    State &state, DepositAcceptor &acceptor)
    : state_{state}
    , acceptor_{acceptor}
    , vars{state}
{
}

/////////////
// Events //
/////////////
void BatchDepositContract::emit_add_deposit_data_event(
    Address const &beneficiary, uint64_t const count)
{
    constexpr bytes32_t signature{
        0x5a62994d3f722d87d135d8cfd6f6e3b64b39056c9ddc43ab6b441966f322be54_bytes32};
    EventBuilder builder(BATCH_DEPOSIT_CA, signature);
    auto const event = builder.add_topic(abi_encode_address(beneficiary))
                           .add_data(abi_encode_uint(uint256_t{count}))
                           .build();
    state_.store_log(event);
}

void BatchDepositContract::emit_edit_deposit_data_event(
    Address const &beneficiary, uint256_t const &index)
{
    constexpr bytes32_t signature{
        0xcdabd1defa10628a1a24a2978306cd1c28e05b082a85c1897679cf4f8e0a8e7a_bytes32};
    EventBuilder builder(BATCH_DEPOSIT_CA, signature);
    auto const event = builder.add_topic(abi_encode_address(beneficiary))
                           .add_data(abi_encode_uint(index))
                           .build();
    state_.store_log(event);
}

void BatchDepositContract::emit_delete_deposit_data_event(
    Address const &beneficiary, uint256_t const &count)
{
    constexpr bytes32_t signature{
        0x2cbc1964a2873610bf6e3ed07299980dba2544964d2af83abbb41da48c5efbb9_bytes32};
    EventBuilder builder(BATCH_DEPOSIT_CA, signature);
    auto const event = builder.add_topic(abi_encode_address(beneficiary))
                           .add_data(abi_encode_uint(count))
                           .build();
    state_.store_log(event);
}

void BatchDepositContract::emit_deposited_event(
    Address const &beneficiary, uint64_t const count)
{
    constexpr bytes32_t signature{
        0x2da466a7b24304f47e87fa2e1e5a81b9831ce54fec19055ce277ca2f39ba42c4_bytes32};
    EventBuilder builder(BATCH_DEPOSIT_CA, signature);
    auto const event = builder.add_topic(abi_encode_address(beneficiary))
                           .add_data(abi_encode_uint(uint256_t{count}))
                           .build();
    state_.store_log(event);
}

void BatchDepositContract::emit_deposit_contract_bound_event(
    Address const &deposit_contract)
{
    constexpr bytes32_t signature{
        0x92899c317cda35a3a1507c3216fc758644de9e01640887f7dbc9b7c53a2a2e7f_bytes32};
    EventBuilder builder(BATCH_DEPOSIT_CA, signature);
    auto const event =
        builder.add_topic(abi_encode_address(deposit_contract)).build();
    state_.store_log(event);
}

void BatchDepositContract::emit_ownership_transferred_event(
    Address const &previous_owner, Address const &new_owner)
{
    constexpr bytes32_t signature{
        0x8be0079c531659141344cd1fd0a4f28419497f9722a3daafe3b4186f6b6457e0_bytes32};
    EventBuilder builder(BATCH_DEPOSIT_CA, signature);
    auto const event = builder.add_topic(abi_encode_address(previous_owner))
                           .add_topic(abi_encode_address(new_owner))
                           .build();
    state_.store_log(event);
}

void BatchDepositContract::emit_paused_event(Address const &account)
{
    constexpr bytes32_t signature{
        0x62e78cea01bee320cd4e420270b5ea74000d11b0c9f74754ebdbfc544b05a258_bytes32};
    EventBuilder builder(BATCH_DEPOSIT_CA, signature);
    auto const event = builder.add_data(abi_encode_address(account)).build();
    state_.store_log(event);
}

void BatchDepositContract::emit_unpaused_event(Address const &account)
{
    constexpr bytes32_t signature{
        0x5db9ee0a495bf2e6ff9c91a7834c1ba4fdd244a5e8aa4e537bd38aeae4b073aa_bytes32};
    EventBuilder builder(BATCH_DEPOSIT_CA, signature);
    auto const event = builder.add_data(abi_encode_address(account)).build();
    state_.store_log(event);
}

Result<void> BatchDepositContract::initialize(
    Address const &owner, Address const &deposit_contract)
{
    if (PRELOAD_UNLIKELY(vars.deposit_contract.load_checked().has_value())) {
        return BatchDepositError::InvalidState;
    }
    if (PRELOAD_UNLIKELY(deposit_contract == Address{})) {
        return BatchDepositError::InvalidArgument;
    }

    vars.deposit_contract.store(deposit_contract);
    emit_deposit_contract_bound_event(deposit_contract);

    vars.owner.store(owner);
    emit_ownership_transferred_event(Address{}, owner);
    return outcome::success();
}

/////////////////
// Access Gate //
/////////////////
Result<void> BatchDepositContract::require_owner(Address const &caller)
{
    if (PRELOAD_UNLIKELY(caller != vars.owner.load())) {
        return BatchDepositError::Unauthorized;
    }
    return outcome::success();
}

Result<void> BatchDepositContract::when_not_paused()
{
    if (PRELOAD_UNLIKELY(vars.paused.load())) {
        return BatchDepositError::Paused;
    }
    return outcome::success();
}

Result<void> BatchDepositContract::pause(Address const &caller)
{
    BOOST_OUTCOME_TRY(require_owner(caller));
    BOOST_OUTCOME_TRY(when_not_paused());

    vars.paused.store(true);
    emit_paused_event(caller);
    return outcome::success();
}

Result<void> BatchDepositContract::unpause(Address const &caller)
{
    BOOST_OUTCOME_TRY(require_owner(caller));
    if (PRELOAD_UNLIKELY(!vars.paused.load())) {
        return BatchDepositError::NotPaused;
    }

    vars.paused.clear();
    emit_unpaused_event(caller);
    return outcome::success();
}

Result<void> BatchDepositContract::transfer_ownership(
    Address const &caller, Address const &new_owner)
{
    BOOST_OUTCOME_TRY(require_owner(caller));
    if (PRELOAD_UNLIKELY(new_owner == Address{})) {
        return BatchDepositError::InvalidArgument;
    }

    vars.owner.store(new_owner);
    emit_ownership_transferred_event(caller, new_owner);
    return outcome::success();
}

Result<void> BatchDepositContract::renounce_ownership(Address const &caller)
{
    BOOST_OUTCOME_TRY(require_owner(caller));

    vars.owner.clear();
    emit_ownership_transferred_event(caller, Address{});
    return outcome::success();
}

///////////////////
// Batch Editing //
///////////////////
Result<void> BatchDepositContract::add_deposit_data(
    Address const &caller, Address const &beneficiary,
    std::span<byte_string const> const pubkeys,
    std::span<byte_string const> const withdrawal_credentials,
    std::span<byte_string const> const signatures,
    std::span<bytes32_t const> const deposit_data_roots)
{
    BOOST_OUTCOME_TRY(require_owner(caller));

    size_t const count = pubkeys.size();
    if (PRELOAD_UNLIKELY(
            count == 0 || count > MAX_RECORDS_PER_ADD ||
            withdrawal_credentials.size() != count ||
            signatures.size() != count ||
            deposit_data_roots.size() != count)) {
        return BatchDepositError::InvalidArgument;
    }

    // validate the whole batch before the queue is touched
    std::vector<DepositRecord> records;
    records.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto const record = BOOST_OUTCOME_TRYX(make_deposit_record(
            pubkeys[i],
            withdrawal_credentials[i],
            signatures[i],
            deposit_data_roots[i]));
        records.push_back(record);
    }

    auto queue = vars.deposit_queue(beneficiary);
    for (auto const &record : records) {
        queue.append(record);
    }

    emit_add_deposit_data_event(beneficiary, count);
    return outcome::success();
}

Result<void> BatchDepositContract::edit_deposit_data(
    Address const &caller, Address const &beneficiary,
    byte_string_view const pubkey,
    byte_string_view const withdrawal_credentials,
    byte_string_view const signature, bytes32_t const &deposit_data_root,
    uint256_t const &index)
{
    BOOST_OUTCOME_TRY(require_owner(caller));

    auto queue = vars.deposit_queue(beneficiary);
    if (PRELOAD_UNLIKELY(index >= queue.length())) {
        return BatchDepositError::IndexOutOfRange;
    }
    auto const record = BOOST_OUTCOME_TRYX(make_deposit_record(
        pubkey, withdrawal_credentials, signature, deposit_data_root));
    BOOST_OUTCOME_TRY(queue.set_at(index, record));

    emit_edit_deposit_data_event(beneficiary, index);
    return outcome::success();
}

Result<void> BatchDepositContract::delete_last_n_deposit_entries(
    Address const &caller, Address const &beneficiary, uint256_t const &n)
{
    BOOST_OUTCOME_TRY(require_owner(caller));

    auto queue = vars.deposit_queue(beneficiary);
    if (PRELOAD_UNLIKELY(n == 0 || n > queue.length())) {
        return BatchDepositError::InvalidArgument;
    }
    BOOST_OUTCOME_TRY(queue.pop_last_n(n));

    emit_delete_deposit_data_event(beneficiary, n);
    return outcome::success();
}

Result<void> BatchDepositContract::delete_all_entries(
    Address const &caller, Address const &beneficiary)
{
    BOOST_OUTCOME_TRY(require_owner(caller));

    uint64_t const removed = vars.deposit_queue(beneficiary).clear();

    emit_delete_deposit_data_event(beneficiary, removed);
    return outcome::success();
}

///////////
// Views //
///////////
std::vector<DepositRecord>
BatchDepositContract::get_staker_data(Address const &beneficiary)
{
    return vars.deposit_queue(beneficiary).records();
}

Address BatchDepositContract::owner()
{
    return vars.owner.load();
}

bool BatchDepositContract::paused()
{
    return vars.paused.load();
}

Address BatchDepositContract::deposit_contract()
{
    return vars.deposit_contract.load();
}

/////////////
// Trigger //
/////////////
Result<void> BatchDepositContract::trigger(
    Address const &sender, uint256_t const &value)
{
    BOOST_OUTCOME_TRY(when_not_paused());

    auto queue = vars.deposit_queue(sender);
    if (PRELOAD_UNLIKELY(queue.empty())) {
        return BatchDepositError::NotWhitelisted;
    }

    uint64_t const count = queue.length();
    if (PRELOAD_UNLIKELY(value != count * COLLATERAL)) {
        return BatchDepositError::InvalidArgument;
    }
    if (PRELOAD_UNLIKELY(count > MAX_DEPOSITS_PER_TRIGGER)) {
        return BatchDepositError::InvalidArgument;
    }

    auto const acceptor = vars.deposit_contract.load_checked();
    if (PRELOAD_UNLIKELY(!acceptor.has_value())) {
        return BatchDepositError::InvalidState;
    }

    auto const records = queue.records();
    state_.push();
    for (auto const &record : records) {
        auto res = acceptor_.submit(acceptor.value(), record, COLLATERAL);
        if (PRELOAD_UNLIKELY(res.has_error())) {
            state_.pop_reject();
            return res;
        }
    }
    queue.clear();
    emit_deposited_event(sender, count);
    state_.pop_accept();

    LOG_INFO("forwarded {} deposits for {}", count, sender);
    return outcome::success();
}

/////////////////
// Precompiles //
/////////////////
BatchDepositContract::PrecompileFunc
BatchDepositContract::precompile_dispatch(byte_string_view &input)
{
    if (input.empty()) {
        return &BatchDepositContract::precompile_receive;
    }
    if (PRELOAD_UNLIKELY(input.size() < 4)) {
        return &BatchDepositContract::precompile_fallback;
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case PrecompileSelector::ADD_DEPOSIT_DATA:
        return &BatchDepositContract::precompile_add_deposit_data;
    case PrecompileSelector::EDIT_DEPOSIT_DATA:
        return &BatchDepositContract::precompile_edit_deposit_data;
    case PrecompileSelector::DELETE_LAST_N_DEPOSIT_ENTRIES:
        return &BatchDepositContract::precompile_delete_last_n_deposit_entries;
    case PrecompileSelector::DELETE_ALL_ENTRIES:
        return &BatchDepositContract::precompile_delete_all_entries;
    case PrecompileSelector::GET_STAKER_DATA:
        return &BatchDepositContract::precompile_get_staker_data;
    case PrecompileSelector::PAUSE:
        return &BatchDepositContract::precompile_pause;
    case PrecompileSelector::UNPAUSE:
        return &BatchDepositContract::precompile_unpause;
    case PrecompileSelector::TRANSFER_OWNERSHIP:
        return &BatchDepositContract::precompile_transfer_ownership;
    case PrecompileSelector::RENOUNCE_OWNERSHIP:
        return &BatchDepositContract::precompile_renounce_ownership;
    case PrecompileSelector::OWNER:
        return &BatchDepositContract::precompile_owner;
    case PrecompileSelector::PAUSED:
        return &BatchDepositContract::precompile_paused;
    case PrecompileSelector::DEPOSIT_CONTRACT:
        return &BatchDepositContract::precompile_deposit_contract;
    default:
        return &BatchDepositContract::precompile_fallback;
    }
}

Result<byte_string> BatchDepositContract::precompile_receive(
    byte_string_view, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(
        trigger(msg_sender, intx::be::load<uint256_t>(msg_value)));
    return byte_string{};
}

Result<byte_string> BatchDepositContract::precompile_add_deposit_data(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));

    AbiDecoder decoder{input};
    auto const beneficiary = BOOST_OUTCOME_TRYX(decoder.read<Address>());
    auto const pubkeys =
        BOOST_OUTCOME_TRYX(decoder.read_bytes_array(MAX_RECORDS_PER_ADD));
    auto const withdrawal_credentials =
        BOOST_OUTCOME_TRYX(decoder.read_bytes_array(MAX_RECORDS_PER_ADD));
    auto const signatures =
        BOOST_OUTCOME_TRYX(decoder.read_bytes_array(MAX_RECORDS_PER_ADD));
    auto const deposit_data_roots =
        BOOST_OUTCOME_TRYX(decoder.read_bytes32_array(MAX_RECORDS_PER_ADD));

    BOOST_OUTCOME_TRY(add_deposit_data(
        msg_sender,
        beneficiary,
        pubkeys,
        withdrawal_credentials,
        signatures,
        deposit_data_roots));
    return byte_string{};
}

Result<byte_string> BatchDepositContract::precompile_edit_deposit_data(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));

    AbiDecoder decoder{input};
    auto const beneficiary = BOOST_OUTCOME_TRYX(decoder.read<Address>());
    auto const pubkey = BOOST_OUTCOME_TRYX(decoder.read_bytes());
    auto const withdrawal_credentials =
        BOOST_OUTCOME_TRYX(decoder.read_bytes());
    auto const signature = BOOST_OUTCOME_TRYX(decoder.read_bytes());
    auto const deposit_data_root =
        BOOST_OUTCOME_TRYX(decoder.read<bytes32_t>());
    auto const index = BOOST_OUTCOME_TRYX(decoder.read<u256_be>());

    BOOST_OUTCOME_TRY(edit_deposit_data(
        msg_sender,
        beneficiary,
        pubkey,
        withdrawal_credentials,
        signature,
        deposit_data_root,
        index.native()));
    return byte_string{};
}

Result<byte_string>
BatchDepositContract::precompile_delete_last_n_deposit_entries(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));

    AbiDecoder decoder{input};
    auto const beneficiary = BOOST_OUTCOME_TRYX(decoder.read<Address>());
    auto const n = BOOST_OUTCOME_TRYX(decoder.read<u256_be>());

    BOOST_OUTCOME_TRY(
        delete_last_n_deposit_entries(msg_sender, beneficiary, n.native()));
    return byte_string{};
}

Result<byte_string> BatchDepositContract::precompile_delete_all_entries(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(require_owner(msg_sender));

    AbiDecoder decoder{input};
    auto const beneficiary = BOOST_OUTCOME_TRYX(decoder.read<Address>());

    BOOST_OUTCOME_TRY(delete_all_entries(msg_sender, beneficiary));
    return byte_string{};
}

Result<byte_string> BatchDepositContract::precompile_get_staker_data(
    byte_string_view const input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    AbiDecoder decoder{input};
    auto const beneficiary = BOOST_OUTCOME_TRYX(decoder.read<Address>());

    std::vector<byte_string> pubkeys;
    std::vector<byte_string> withdrawal_credentials;
    std::vector<byte_string> signatures;
    std::vector<bytes32_t> deposit_data_roots;
    for (auto const &record : get_staker_data(beneficiary)) {
        pubkeys.emplace_back(pubkey_of(record));
        withdrawal_credentials.emplace_back(withdrawal_credentials_of(record));
        signatures.emplace_back(signature_of(record));
        deposit_data_roots.push_back(record.deposit_data_root);
    }

    AbiEncoder encoder;
    encoder.add_bytes_array(pubkeys);
    encoder.add_bytes_array(withdrawal_credentials);
    encoder.add_bytes_array(signatures);
    encoder.add_bytes32_array(deposit_data_roots);
    return encoder.encode_final();
}

Result<byte_string> BatchDepositContract::precompile_pause(
    byte_string_view, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(pause(msg_sender));
    return byte_string{};
}

Result<byte_string> BatchDepositContract::precompile_unpause(
    byte_string_view, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(unpause(msg_sender));
    return byte_string{};
}

Result<byte_string> BatchDepositContract::precompile_transfer_ownership(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    AbiDecoder decoder{input};
    auto const new_owner = BOOST_OUTCOME_TRYX(decoder.read<Address>());

    BOOST_OUTCOME_TRY(transfer_ownership(msg_sender, new_owner));
    return byte_string{};
}

Result<byte_string> BatchDepositContract::precompile_renounce_ownership(
    byte_string_view, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));
    BOOST_OUTCOME_TRY(renounce_ownership(msg_sender));
    return byte_string{};
}

Result<byte_string> BatchDepositContract::precompile_owner(
    byte_string_view, evmc_address const &, evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    AbiEncoder encoder;
    encoder.add_address(owner());
    return encoder.encode_final();
}

Result<byte_string> BatchDepositContract::precompile_paused(
    byte_string_view, evmc_address const &, evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    AbiEncoder encoder;
    encoder.add_bool(paused());
    return encoder.encode_final();
}

Result<byte_string> BatchDepositContract::precompile_deposit_contract(
    byte_string_view, evmc_address const &, evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    AbiEncoder encoder;
    encoder.add_address(deposit_contract());
    return encoder.encode_final();
}

Result<byte_string> BatchDepositContract::precompile_fallback(
    byte_string_view, evmc_address const &, evmc_uint256be const &)
{
    return BatchDepositError::MethodNotSupported;
}

PRELOAD_NAMESPACE_END
