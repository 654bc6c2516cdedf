#pragma once

#include <preload/core/config.hpp>
#include <preload/core/int.hpp>
#include <preload/core/result.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>
#include <preload/execution/ethereum/core/address.hpp>

PRELOAD_NAMESPACE_BEGIN

// The service that accepts one validator deposit per call. A failed submit
// must leave no trace of the attempt.
class DepositAcceptor
{
public:
    virtual ~DepositAcceptor() = default;

    virtual Result<void> submit(
        Address const &acceptor, DepositRecord const &,
        uint256_t const &value) = 0;
};

PRELOAD_NAMESPACE_END
