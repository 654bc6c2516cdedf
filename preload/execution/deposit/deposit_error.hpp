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

enum class DepositError
{
    Success = 0,
    MethodNotSupported,
    InvalidInput,
    ValueNonZero,
    InvalidPubkeyLength,
    InvalidWithdrawalCredentialsLength,
    InvalidSignatureLength,
    DepositValueTooLow,
    DepositValueNotMultipleOfGwei,
    DepositValueTooHigh,
    DepositDataRootMismatch,
    MerkleTreeFull,
};

PRELOAD_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<preload::DepositError>
    : quick_status_code_from_enum_defaults<preload::DepositError>
{
    static constexpr auto const domain_name = "Deposit Error";
    static constexpr auto const domain_uuid =
        "5d2c9e41-0a7b-4f36-8e15-c3b6d9a27f08";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
