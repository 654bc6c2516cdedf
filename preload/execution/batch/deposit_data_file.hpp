#pragma once

#include <preload/core/config.hpp>
#include <preload/core/result.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <vector>

PRELOAD_NAMESPACE_BEGIN

// Reads deposit records in either of two layouts:
//
//  * the deposit-cli output, an array of objects with hex `pubkey`,
//    `withdrawal_credentials`, `signature` and `deposit_data_root` fields
//    and an optional `amount` in gwei, which must be 32 ether;
//  * a batched object holding the four parallel arrays `pubkey`,
//    `withdrawal_credentials`, `signatures` and `deposit_data_roots`.
//
// Hex strings may carry a 0x prefix. Any malformed entry fails the whole file
// with InvalidArgument.
Result<std::vector<DepositRecord>> load_deposit_data(nlohmann::json const &);

Result<std::vector<DepositRecord>>
load_deposit_data_file(std::filesystem::path const &);

PRELOAD_NAMESPACE_END
