#pragma once

#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/int.hpp>
#include <preload/core/result.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/storage_array.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <cstdint>
#include <vector>

PRELOAD_NAMESPACE_BEGIN

// Ordered records queued for one beneficiary. All four fields of a record
// live in the same storage element, so they can only change together.
class DepositQueue
{
    StorageArray<DepositRecord> records_;

public:
    DepositQueue(State &, Address const &ca, bytes32_t const &slot);

    uint64_t length() const noexcept;
    bool empty() const noexcept;

    Result<DepositRecord> get(uint256_t const &index) const;
    std::vector<DepositRecord> records() const;

    void append(DepositRecord const &);
    Result<void> set_at(uint256_t const &index, DepositRecord const &);
    Result<void> pop_last_n(uint256_t const &n);

    // returns the number of records removed
    uint64_t clear();
};

PRELOAD_NAMESPACE_END
