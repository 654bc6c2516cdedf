#include <preload/core/byte_string.hpp>
#include <preload/core/config.hpp>
#include <preload/core/fmt/address_fmt.hpp>
#include <preload/core/int.hpp>
#include <preload/core/likely.h>
#include <preload/core/result.hpp>
#include <preload/execution/batch/native_deposit_acceptor.hpp>
#include <preload/execution/batch/util/batch_error.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/abi_encode.hpp>
#include <preload/execution/ethereum/core/contract/abi_signatures.hpp>
#include <preload/execution/ethereum/evm.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <boost/outcome/success_failure.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <cstdint>

PRELOAD_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint32_t DEPOSIT_SELECTOR =
    abi_encode_selector("deposit(bytes,bytes,bytes,bytes32)");

byte_string encode_deposit_call(DepositRecord const &record)
{
    byte_string input;
    input.resize(sizeof(DEPOSIT_SELECTOR));
    intx::be::unsafe::store(input.data(), DEPOSIT_SELECTOR);

    AbiEncoder encoder;
    encoder.add_bytes(pubkey_of(record));
    encoder.add_bytes(withdrawal_credentials_of(record));
    encoder.add_bytes(signature_of(record));
    encoder.add_bytes32(record.deposit_data_root);
    input += encoder.encode_final();
    return input;
}

PRELOAD_ANONYMOUS_NAMESPACE_END

PRELOAD_NAMESPACE_BEGIN

NativeDepositAcceptor::NativeDepositAcceptor(
    State &state, Address const &caller)
    : state_{state}
    , caller_{caller}
{
}

Result<void> NativeDepositAcceptor::submit(
    Address const &acceptor, DepositRecord const &record,
    uint256_t const &value)
{
    byte_string const input = encode_deposit_call(record);
    evmc_message const msg{
        .kind = EVMC_CALL,
        .flags = 0,
        .depth = static_cast<int32_t>(state_.depth()),
        .gas = 0,
        .recipient = acceptor,
        .sender = caller_,
        .input_data = input.data(),
        .input_size = input.size(),
        .value = intx::be::store<evmc_uint256be>(value),
        .create2_salt = {},
        .code_address = acceptor,
        .code = nullptr,
        .code_size = 0,
    };

    evmc::Result const result = Call{state_}(msg);
    if (PRELOAD_UNLIKELY(result.status_code != EVMC_SUCCESS)) {
        LOG_WARNING(
            "deposit to {} rejected with status {}",
            acceptor,
            static_cast<int>(result.status_code));
        return BatchDepositError::DepositRejected;
    }

    return outcome::success();
}

PRELOAD_NAMESPACE_END
