#include <preload/execution/deposit/deposit_error.hpp>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<preload::DepositError>::mapping> const &
quick_status_code_from_enum<preload::DepositError>::value_mappings()
{
    using preload::DepositError;

    static std::initializer_list<mapping> const v = {
        {DepositError::Success, "success", {errc::success}},
        {DepositError::MethodNotSupported, "method not supported", {}},
        {DepositError::InvalidInput, "invalid input", {}},
        {DepositError::ValueNonZero, "value is nonzero", {}},
        {DepositError::InvalidPubkeyLength,
         "DepositContract: invalid pubkey length",
         {}},
        {DepositError::InvalidWithdrawalCredentialsLength,
         "DepositContract: invalid withdrawal_credentials length",
         {}},
        {DepositError::InvalidSignatureLength,
         "DepositContract: invalid signature length",
         {}},
        {DepositError::DepositValueTooLow,
         "DepositContract: deposit value too low",
         {}},
        {DepositError::DepositValueNotMultipleOfGwei,
         "DepositContract: deposit value not multiple of gwei",
         {}},
        {DepositError::DepositValueTooHigh,
         "DepositContract: deposit value too high",
         {}},
        {DepositError::DepositDataRootMismatch,
         "DepositContract: reconstructed DepositData does not match supplied "
         "deposit_data_root",
         {}},
        {DepositError::MerkleTreeFull, "DepositContract: merkle tree full", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
