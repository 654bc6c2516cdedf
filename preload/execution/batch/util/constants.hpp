#pragma once

#include <preload/core/config.hpp>
#include <preload/core/int.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/units.hpp>

#include <cstddef>
#include <cstdint>

PRELOAD_NAMESPACE_BEGIN

inline constexpr Address BATCH_DEPOSIT_CA{0x1002};

// value forwarded with every queued record
inline constexpr uint256_t COLLATERAL = 32 * ETHER;

inline constexpr uint64_t MAX_RECORDS_PER_ADD = 100;
inline constexpr uint64_t MAX_DEPOSITS_PER_TRIGGER = 150;

inline constexpr size_t PUBKEY_LENGTH = 48;
inline constexpr size_t WITHDRAWAL_CREDENTIALS_LENGTH = 32;
inline constexpr size_t SIGNATURE_LENGTH = 96;

PRELOAD_NAMESPACE_END
