#include <preload/core/assert.h>
#include <preload/core/byte_string.hpp>
#include <preload/core/config.hpp>
#include <preload/core/int.hpp>
#include <preload/core/likely.h>
#include <preload/core/result.hpp>
#include <preload/execution/batch/batch_deposit_contract.hpp>
#include <preload/execution/batch/native_deposit_acceptor.hpp>
#include <preload/execution/batch/util/constants.hpp>
#include <preload/execution/deposit/deposit_contract.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/abi_encode.hpp>
#include <preload/execution/ethereum/evm.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <optional>
#include <utility>

PRELOAD_ANONYMOUS_NAMESPACE_BEGIN

bool sender_has_balance(State &state, evmc_message const &msg) noexcept
{
    auto const value = intx::be::load<uint256_t>(msg.value);
    auto const balance =
        intx::be::load<uint256_t>(state.get_balance(msg.sender));
    return balance >= value;
}

void transfer_balances(
    State &state, evmc_message const &msg, Address const &to) noexcept
{
    auto const value = intx::be::load<uint256_t>(msg.value);
    state.subtract_from_balance(msg.sender, value);
    state.add_to_balance(to, value);
}

// Native contracts do not meter gas, so gas_left is always the gas supplied.
template <typename Contract>
evmc::Result call_native(Contract &contract, evmc_message const &msg)
{
    byte_string_view input{msg.input_data, msg.input_size};
    auto const func = Contract::precompile_dispatch(input);
    auto const res = (contract.*func)(input, msg.sender, msg.value);
    if (PRELOAD_UNLIKELY(res.has_error())) {
        byte_string const output =
            abi_encode_error_string(res.error().message().c_str());
        return evmc::Result{
            EVMC_REVERT, msg.gas, 0, output.data(), output.size()};
    }

    auto const &output = res.value();
    return evmc::Result{
        EVMC_SUCCESS, msg.gas, 0, output.data(), output.size()};
}

PRELOAD_ANONYMOUS_NAMESPACE_END

PRELOAD_NAMESPACE_BEGIN

std::optional<evmc::Result>
check_call_native_contract(State &state, evmc_message const &msg)
{
    Address const code_address{msg.code_address};

    if (code_address == BATCH_DEPOSIT_CA) {
        NativeDepositAcceptor acceptor{state, BATCH_DEPOSIT_CA};
        BatchDepositContract contract{state, acceptor};
        return call_native(contract, msg);
    }
    if (code_address == DEPOSIT_CONTRACT_ADDRESS) {
        DepositContract contract{state};
        return call_native(contract, msg);
    }

    return std::nullopt;
}

Call::Call(State &state)
    : state_{state}
{
}

std::optional<evmc::Result> Call::pre_call(evmc_message const &msg)
{
    state_.push();

    if (PRELOAD_UNLIKELY(!sender_has_balance(state_, msg))) {
        state_.pop_reject();
        return evmc::Result{EVMC_INSUFFICIENT_BALANCE, msg.gas};
    }
    transfer_balances(state_, msg, msg.recipient);

    return std::nullopt;
}

void Call::post_call(evmc::Result const &result)
{
    PRELOAD_ASSERT(
        result.status_code == EVMC_SUCCESS ||
        result.status_code == EVMC_REVERT);

    if (result.status_code == EVMC_SUCCESS) {
        state_.pop_accept();
    }
    else {
        state_.pop_reject();
    }
}

evmc::Result Call::operator()(evmc_message const &msg) noexcept
{
    PRELOAD_ASSERT(msg.kind == EVMC_CALL);
    PRELOAD_ASSERT(Address{msg.recipient} == Address{msg.code_address});

    if (auto result = pre_call(msg); result.has_value()) {
        return std::move(result.value());
    }

    // accounts without native code only receive the value
    evmc::Result result{EVMC_SUCCESS, msg.gas};
    if (auto maybe_result = check_call_native_contract(state_, msg);
        maybe_result.has_value()) {
        result = std::move(maybe_result.value());
    }

    post_call(result);
    return result;
}

PRELOAD_NAMESPACE_END
