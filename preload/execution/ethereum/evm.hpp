#pragma once

#include <preload/core/config.hpp>
#include <preload/execution/ethereum/core/address.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <optional>

PRELOAD_NAMESPACE_BEGIN

class State;

// Runs a native contract when `msg.code_address` is one, returns nullopt
// otherwise.
std::optional<evmc::Result>
check_call_native_contract(State &, evmc_message const &);

// Executes one message call: value transfer plus native contract dispatch
// inside its own State frame. The frame is accepted on success and rejected
// otherwise.
class Call
{
    State &state_;

    std::optional<evmc::Result> pre_call(evmc_message const &);
    void post_call(evmc::Result const &);

public:
    explicit Call(State &);

    evmc::Result operator()(evmc_message const &) noexcept;
};

PRELOAD_NAMESPACE_END
