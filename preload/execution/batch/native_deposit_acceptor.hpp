#pragma once

#include <preload/core/config.hpp>
#include <preload/core/int.hpp>
#include <preload/core/result.hpp>
#include <preload/execution/batch/deposit_acceptor.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>
#include <preload/execution/ethereum/core/address.hpp>

PRELOAD_NAMESPACE_BEGIN

class State;

// Forwards records as `deposit(bytes,bytes,bytes,bytes32)` message calls from
// `caller` to the acceptor address, so value moves and the acceptor's own
// checks run exactly as for any other sender.
class NativeDepositAcceptor : public DepositAcceptor
{
    State &state_;
    Address const caller_;

public:
    NativeDepositAcceptor(State &, Address const &caller);

    Result<void> submit(
        Address const &acceptor, DepositRecord const &,
        uint256_t const &value) override;
};

PRELOAD_NAMESPACE_END
