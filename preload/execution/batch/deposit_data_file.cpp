#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/core/likely.h>
#include <preload/core/result.hpp>
#include <preload/execution/batch/deposit_data_file.hpp>
#include <preload/execution/batch/util/batch_error.hpp>
#include <preload/execution/batch/util/constants.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>
#include <preload/execution/ethereum/core/units.hpp>

#include <boost/outcome/try.hpp>

#include <evmc/hex.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

PRELOAD_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint64_t COLLATERAL_GWEI = 32'000'000'000;

static_assert(COLLATERAL == COLLATERAL_GWEI * GWEI);

std::optional<byte_string> decode_hex(nlohmann::json const &value)
{
    if (PRELOAD_UNLIKELY(!value.is_string())) {
        return std::nullopt;
    }
    auto const decoded = evmc::from_hex(value.get<std::string>());
    if (PRELOAD_UNLIKELY(!decoded.has_value())) {
        return std::nullopt;
    }
    return byte_string(decoded->data(), decoded->size());
}

Result<DepositRecord> decode_record(
    nlohmann::json const &pubkey, nlohmann::json const &withdrawal_credentials,
    nlohmann::json const &signature, nlohmann::json const &deposit_data_root,
    size_t const index)
{
    auto const pk = decode_hex(pubkey);
    auto const wc = decode_hex(withdrawal_credentials);
    auto const sig = decode_hex(signature);
    auto const root = decode_hex(deposit_data_root);
    if (PRELOAD_UNLIKELY(
            !pk.has_value() || !wc.has_value() || !sig.has_value() ||
            !root.has_value())) {
        LOG_ERROR("deposit data entry {}: missing or malformed hex", index);
        return BatchDepositError::InvalidArgument;
    }
    if (PRELOAD_UNLIKELY(root->size() != sizeof(bytes32_t))) {
        LOG_ERROR(
            "deposit data entry {}: deposit_data_root is {} bytes",
            index,
            root->size());
        return BatchDepositError::InvalidArgument;
    }

    auto record = make_deposit_record(*pk, *wc, *sig, to_bytes(*root));
    if (PRELOAD_UNLIKELY(record.has_error())) {
        LOG_ERROR(
            "deposit data entry {}: field lengths {}/{}/{} instead of "
            "{}/{}/{}",
            index,
            pk->size(),
            wc->size(),
            sig->size(),
            PUBKEY_LENGTH,
            WITHDRAWAL_CREDENTIALS_LENGTH,
            SIGNATURE_LENGTH);
    }
    return record;
}

Result<std::vector<DepositRecord>>
load_deposit_cli_array(nlohmann::json const &entries)
{
    std::vector<DepositRecord> records;
    records.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        auto const &entry = entries[i];
        if (PRELOAD_UNLIKELY(!entry.is_object())) {
            LOG_ERROR("deposit data entry {}: not an object", i);
            return BatchDepositError::InvalidArgument;
        }
        if (entry.contains("amount")) {
            auto const &amount = entry["amount"];
            if (PRELOAD_UNLIKELY(
                    !amount.is_number_unsigned() ||
                    amount.get<uint64_t>() != COLLATERAL_GWEI)) {
                LOG_ERROR(
                    "deposit data entry {}: amount {} is not {} gwei",
                    i,
                    amount.dump(),
                    COLLATERAL_GWEI);
                return BatchDepositError::InvalidArgument;
            }
        }
        auto const null = nlohmann::json{};
        auto const field = [&](char const *const name) -> auto const & {
            return entry.contains(name) ? entry[name] : null;
        };
        auto const record = BOOST_OUTCOME_TRYX(decode_record(
            field("pubkey"),
            field("withdrawal_credentials"),
            field("signature"),
            field("deposit_data_root"),
            i));
        records.push_back(record);
    }
    return records;
}

// A column is found under its singular or its plural key, e.g. `signature`
// or `signatures`.
nlohmann::json const *find_column(
    nlohmann::json const &batch, std::initializer_list<char const *> const keys)
{
    for (char const *const key : keys) {
        if (batch.contains(key) && batch[key].is_array()) {
            return &batch[key];
        }
    }
    LOG_ERROR("deposit data: `{}` is not an array", *keys.begin());
    return nullptr;
}

Result<std::vector<DepositRecord>>
load_batched_object(nlohmann::json const &batch)
{
    auto const *const pubkeys_column =
        find_column(batch, {"pubkey", "pubkeys"});
    auto const *const withdrawal_credentials_column =
        find_column(batch, {"withdrawal_credentials"});
    auto const *const signatures_column =
        find_column(batch, {"signature", "signatures"});
    auto const *const deposit_data_roots_column =
        find_column(batch, {"deposit_data_root", "deposit_data_roots"});
    if (PRELOAD_UNLIKELY(
            pubkeys_column == nullptr ||
            withdrawal_credentials_column == nullptr ||
            signatures_column == nullptr ||
            deposit_data_roots_column == nullptr)) {
        return BatchDepositError::InvalidArgument;
    }

    auto const &pubkeys = *pubkeys_column;
    auto const &withdrawal_credentials = *withdrawal_credentials_column;
    auto const &signatures = *signatures_column;
    auto const &deposit_data_roots = *deposit_data_roots_column;
    size_t const count = pubkeys.size();
    if (PRELOAD_UNLIKELY(
            withdrawal_credentials.size() != count ||
            signatures.size() != count || deposit_data_roots.size() != count)) {
        LOG_ERROR(
            "deposit data: array lengths differ ({}/{}/{}/{})",
            count,
            withdrawal_credentials.size(),
            signatures.size(),
            deposit_data_roots.size());
        return BatchDepositError::InvalidArgument;
    }

    std::vector<DepositRecord> records;
    records.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto const record = BOOST_OUTCOME_TRYX(decode_record(
            pubkeys[i],
            withdrawal_credentials[i],
            signatures[i],
            deposit_data_roots[i],
            i));
        records.push_back(record);
    }
    return records;
}

PRELOAD_ANONYMOUS_NAMESPACE_END

PRELOAD_NAMESPACE_BEGIN

Result<std::vector<DepositRecord>> load_deposit_data(nlohmann::json const &json)
{
    if (json.is_array()) {
        return load_deposit_cli_array(json);
    }
    if (json.is_object()) {
        return load_batched_object(json);
    }
    LOG_ERROR("deposit data: expected an array or an object");
    return BatchDepositError::InvalidArgument;
}

Result<std::vector<DepositRecord>>
load_deposit_data_file(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (PRELOAD_UNLIKELY(!in)) {
        LOG_ERROR("could not open deposit data file {}", path.string());
        return BatchDepositError::InvalidArgument;
    }

    auto const json = nlohmann::json::parse(in, nullptr, false);
    if (PRELOAD_UNLIKELY(json.is_discarded())) {
        LOG_ERROR("deposit data file {} is not valid json", path.string());
        return BatchDepositError::InvalidArgument;
    }
    return load_deposit_data(json);
}

PRELOAD_NAMESPACE_END
