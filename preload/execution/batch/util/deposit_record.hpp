#pragma once

#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/result.hpp>
#include <preload/execution/batch/util/constants.hpp>

#include <cstdint>
#include <type_traits>

PRELOAD_NAMESPACE_BEGIN

// One validator's deposit parameters, packed so the whole record occupies
// seven consecutive storage slots.
struct DepositRecord
{
    uint8_t pubkey[PUBKEY_LENGTH];
    uint8_t withdrawal_credentials[WITHDRAWAL_CREDENTIALS_LENGTH];
    uint8_t signature[SIGNATURE_LENGTH];
    bytes32_t deposit_data_root;

    friend bool operator==(DepositRecord const &, DepositRecord const &) =
        default;
};

static_assert(sizeof(DepositRecord) == 208);
static_assert(alignof(DepositRecord) == 1);
static_assert(std::is_trivially_copyable_v<DepositRecord>);

// Fails with InvalidArgument unless every blob has its exact length
Result<DepositRecord> make_deposit_record(
    byte_string_view pubkey, byte_string_view withdrawal_credentials,
    byte_string_view signature, bytes32_t const &deposit_data_root);

inline byte_string_view pubkey_of(DepositRecord const &r)
{
    return to_byte_string_view(r.pubkey);
}

inline byte_string_view withdrawal_credentials_of(DepositRecord const &r)
{
    return to_byte_string_view(r.withdrawal_credentials);
}

inline byte_string_view signature_of(DepositRecord const &r)
{
    return to_byte_string_view(r.signature);
}

PRELOAD_NAMESPACE_END
