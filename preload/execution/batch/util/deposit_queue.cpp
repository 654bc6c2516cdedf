#include <preload/core/bytes.hpp>
#include <preload/core/int.hpp>
#include <preload/core/likely.h>
#include <preload/core/result.hpp>
#include <preload/execution/batch/util/batch_error.hpp>
#include <preload/execution/batch/util/deposit_queue.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>

#include <boost/outcome/success_failure.hpp>

#include <cstdint>
#include <vector>

PRELOAD_NAMESPACE_BEGIN

DepositQueue::DepositQueue(
    State &state, Address const &ca, bytes32_t const &slot)
    : records_{state, ca, slot}
{
}

uint64_t DepositQueue::length() const noexcept
{
    return records_.length();
}

bool DepositQueue::empty() const noexcept
{
    return records_.empty();
}

Result<DepositRecord> DepositQueue::get(uint256_t const &index) const
{
    if (PRELOAD_UNLIKELY(index >= length())) {
        return BatchDepositError::IndexOutOfRange;
    }
    return records_.get(static_cast<uint64_t>(index)).load();
}

std::vector<DepositRecord> DepositQueue::records() const
{
    auto const len = length();
    std::vector<DepositRecord> out;
    out.reserve(len);
    for (uint64_t i = 0; i < len; ++i) {
        out.push_back(records_.get(i).load());
    }
    return out;
}

void DepositQueue::append(DepositRecord const &record)
{
    records_.push(record);
}

Result<void>
DepositQueue::set_at(uint256_t const &index, DepositRecord const &record)
{
    if (PRELOAD_UNLIKELY(index >= length())) {
        return BatchDepositError::IndexOutOfRange;
    }
    records_.get(static_cast<uint64_t>(index)).store(record);
    return outcome::success();
}

Result<void> DepositQueue::pop_last_n(uint256_t const &n)
{
    auto const len = length();
    if (PRELOAD_UNLIKELY(n > len)) {
        return BatchDepositError::IndexOutOfRange;
    }
    records_.truncate(len - static_cast<uint64_t>(n));
    return outcome::success();
}

uint64_t DepositQueue::clear()
{
    auto const len = length();
    records_.clear();
    return len;
}

PRELOAD_NAMESPACE_END
