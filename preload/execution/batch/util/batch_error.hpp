#pragma once

#include <preload/core/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

PRELOAD_NAMESPACE_BEGIN

enum class BatchDepositError
{
    Success = 0,
    InternalError,
    MethodNotSupported,
    InvalidInput,
    ValueNonZero,
    Unauthorized,
    NotWhitelisted, // trigger from a sender with nothing staged
    InvalidState,
    Paused, // trigger or pause while paused
    NotPaused, // unpause while not paused
    IndexOutOfRange,
    InvalidArgument,
    DepositRejected,
};

PRELOAD_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<preload::BatchDepositError>
    : quick_status_code_from_enum_defaults<preload::BatchDepositError>
{
    static constexpr auto const domain_name = "Batch Deposit Error";
    static constexpr auto const domain_uuid =
        "b1e5a0f2-7c3d-4e89-9a61-2f4d8c0b5e17";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
