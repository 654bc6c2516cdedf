#include <preload/core/assert.h>
#include <preload/core/config.hpp>
#include <preload/execution/ethereum/core/receipt.hpp>
#include <preload/execution/ethereum/evm.hpp>
#include <preload/execution/ethereum/execute_transaction.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstddef>
#include <utility>

PRELOAD_NAMESPACE_BEGIN

TransactionOutcome
execute_transaction(State &state, evmc_message const &msg)
{
    PRELOAD_ASSERT(state.depth() == 0);
    PRELOAD_ASSERT(msg.depth == 0);

    auto const &logs = state.logs();
    size_t const first_log = logs.size();

    evmc::Result result = Call{state}(msg);

    Receipt receipt;
    if (result.status_code == EVMC_SUCCESS) {
        receipt.status = Receipt::SUCCESS;
        receipt.logs.assign(logs.begin() + first_log, logs.end());
    }
    return TransactionOutcome{std::move(result), std::move(receipt)};
}

PRELOAD_NAMESPACE_END
