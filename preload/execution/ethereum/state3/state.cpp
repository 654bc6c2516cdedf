#include <preload/core/assert.h>
#include <preload/core/bytes.hpp>
#include <preload/core/int.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/receipt.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <intx/intx.hpp>

#include <type_traits>
#include <utility>
#include <variant>

PRELOAD_NAMESPACE_BEGIN

State::AccountState const *State::find(Address const &address) const noexcept
{
    auto const it = accounts_.find(address);
    return it == accounts_.end() ? nullptr : &it->second;
}

void State::record(JournalEntry entry)
{
    // nothing to roll back to outside of a checkpoint
    if (checkpoints_.empty()) {
        return;
    }
    journal_.emplace_back(std::move(entry));
}

void State::set_balance(Address const &address, uint256_t const &balance)
{
    auto &account = accounts_[address];
    record(BalanceChange{.address = address, .previous = account.balance});
    account.balance = balance;
}

bytes32_t State::get_balance(Address const &address) const noexcept
{
    auto const *const account = find(address);
    if (account == nullptr) {
        return {};
    }
    return intx::be::store<bytes32_t>(account->balance);
}

void State::add_to_balance(Address const &address, uint256_t const &delta)
{
    auto const balance = intx::be::load<uint256_t>(get_balance(address));
    PRELOAD_ASSERT(balance + delta >= balance);
    set_balance(address, balance + delta);
}

void State::subtract_from_balance(
    Address const &address, uint256_t const &delta)
{
    auto const balance = intx::be::load<uint256_t>(get_balance(address));
    PRELOAD_ASSERT(balance >= delta);
    set_balance(address, balance - delta);
}

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const noexcept
{
    auto const *const account = find(address);
    if (account == nullptr) {
        return {};
    }
    auto const it = account->storage.find(key);
    return it == account->storage.end() ? bytes32_t{} : it->second;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto &storage = accounts_[address].storage;
    auto const it = storage.find(key);
    bytes32_t const previous =
        it == storage.end() ? bytes32_t{} : it->second;
    if (previous == value) {
        return;
    }
    record(StorageChange{.address = address, .key = key, .previous = previous});
    if (value == bytes32_t{}) {
        storage.erase(key);
    }
    else {
        storage[key] = value;
    }
}

size_t State::storage_size(Address const &address) const noexcept
{
    auto const *const account = find(address);
    return account == nullptr ? 0 : account->storage.size();
}

void State::store_log(Receipt::Log const &log)
{
    logs_.push_back(log);
}

std::vector<Receipt::Log> const &State::logs() const noexcept
{
    return logs_;
}

void State::push()
{
    checkpoints_.push_back(
        {.journal_size = journal_.size(), .log_count = logs_.size()});
}

void State::pop_accept()
{
    PRELOAD_ASSERT(!checkpoints_.empty());
    checkpoints_.pop_back();
    if (checkpoints_.empty()) {
        journal_.clear();
    }
}

void State::pop_reject()
{
    PRELOAD_ASSERT(!checkpoints_.empty());
    auto const checkpoint = checkpoints_.back();
    checkpoints_.pop_back();

    while (journal_.size() > checkpoint.journal_size) {
        std::visit(
            [this](auto const &change) {
                using T = std::decay_t<decltype(change)>;
                auto &account = accounts_[change.address];
                if constexpr (std::is_same_v<T, BalanceChange>) {
                    account.balance = change.previous;
                }
                else if (change.previous == bytes32_t{}) {
                    account.storage.erase(change.key);
                }
                else {
                    account.storage[change.key] = change.previous;
                }
            },
            journal_.back());
        journal_.pop_back();
    }
    logs_.resize(checkpoint.log_count);
}

size_t State::depth() const noexcept
{
    return checkpoints_.size();
}

PRELOAD_NAMESPACE_END
