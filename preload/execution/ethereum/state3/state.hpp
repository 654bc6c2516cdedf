#pragma once

#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/int.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/receipt.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <variant>
#include <vector>

PRELOAD_NAMESPACE_BEGIN

// In-memory world state with nested checkpoints. Every mutation made after a
// push() is journaled so that pop_reject() restores balances, storage and
// logs to exactly what they were at the matching push().
class State
{
    struct AccountState
    {
        uint256_t balance{0};
        ankerl::unordered_dense::map<bytes32_t, bytes32_t> storage{};
    };

    struct BalanceChange
    {
        Address address;
        uint256_t previous;
    };

    struct StorageChange
    {
        Address address;
        bytes32_t key;
        bytes32_t previous;
    };

    using JournalEntry = std::variant<BalanceChange, StorageChange>;

    struct Checkpoint
    {
        size_t journal_size;
        size_t log_count;
    };

    ankerl::unordered_dense::map<Address, AccountState> accounts_{};
    std::vector<JournalEntry> journal_{};
    std::vector<Checkpoint> checkpoints_{};
    std::vector<Receipt::Log> logs_{};

    AccountState const *find(Address const &) const noexcept;
    void set_balance(Address const &, uint256_t const &);
    void record(JournalEntry);

public:
    State() = default;
    State(State const &) = delete;
    State &operator=(State const &) = delete;

    bytes32_t get_balance(Address const &) const noexcept;
    void add_to_balance(Address const &, uint256_t const &delta);
    void subtract_from_balance(Address const &, uint256_t const &delta);

    bytes32_t get_storage(Address const &, bytes32_t const &key) const noexcept;
    void set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);
    size_t storage_size(Address const &) const noexcept;

    void store_log(Receipt::Log const &);
    std::vector<Receipt::Log> const &logs() const noexcept;

    void push();
    void pop_accept();
    void pop_reject();
    size_t depth() const noexcept;
};

PRELOAD_NAMESPACE_END
