#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/likely.h>
#include <preload/core/result.hpp>
#include <preload/execution/batch/util/batch_error.hpp>
#include <preload/execution/batch/util/constants.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>

#include <cstring>

PRELOAD_NAMESPACE_BEGIN

Result<DepositRecord> make_deposit_record(
    byte_string_view const pubkey,
    byte_string_view const withdrawal_credentials,
    byte_string_view const signature, bytes32_t const &deposit_data_root)
{
    if (PRELOAD_UNLIKELY(
            pubkey.size() != PUBKEY_LENGTH ||
            withdrawal_credentials.size() != WITHDRAWAL_CREDENTIALS_LENGTH ||
            signature.size() != SIGNATURE_LENGTH)) {
        return BatchDepositError::InvalidArgument;
    }

    DepositRecord record;
    std::memcpy(record.pubkey, pubkey.data(), PUBKEY_LENGTH);
    std::memcpy(
        record.withdrawal_credentials,
        withdrawal_credentials.data(),
        WITHDRAWAL_CREDENTIALS_LENGTH);
    std::memcpy(record.signature, signature.data(), SIGNATURE_LENGTH);
    record.deposit_data_root = deposit_data_root;
    return record;
}

PRELOAD_NAMESPACE_END
