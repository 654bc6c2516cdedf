#pragma once

#include <preload/core/config.hpp>
#include <preload/execution/ethereum/core/receipt.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

PRELOAD_NAMESPACE_BEGIN

class State;

struct TransactionOutcome
{
    evmc::Result result;
    Receipt receipt;
};

// Runs a top level message call. The receipt carries only the logs emitted
// by this message; on failure every state change is already rolled back.
TransactionOutcome execute_transaction(State &, evmc_message const &);

PRELOAD_NAMESPACE_END
