#include <preload/execution/batch/util/batch_error.hpp>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<preload::BatchDepositError>::mapping> const &
quick_status_code_from_enum<preload::BatchDepositError>::value_mappings()
{
    using preload::BatchDepositError;

    static std::initializer_list<mapping> const v = {
        {BatchDepositError::Success, "success", {errc::success}},
        {BatchDepositError::InternalError, "internal error", {}},
        {BatchDepositError::MethodNotSupported, "method not supported", {}},
        {BatchDepositError::InvalidInput, "invalid input", {}},
        {BatchDepositError::ValueNonZero, "function not payable", {}},
        {BatchDepositError::Unauthorized, "not authorized", {}},
        {BatchDepositError::NotWhitelisted, "not whitelisted", {}},
        {BatchDepositError::InvalidState, "invalid state", {}},
        {BatchDepositError::Paused, "paused", {}},
        {BatchDepositError::NotPaused, "not paused", {}},
        {BatchDepositError::IndexOutOfRange, "index out of range", {}},
        {BatchDepositError::InvalidArgument, "invalid argument", {}},
        {BatchDepositError::DepositRejected, "deposit rejected", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
