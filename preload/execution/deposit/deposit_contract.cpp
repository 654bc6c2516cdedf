#include <preload/core/assert.h>
#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/int.hpp>
#include <preload/core/likely.h>
#include <preload/core/result.hpp>
#include <preload/core/sha256.hpp>
#include <preload/execution/deposit/deposit_contract.hpp>
#include <preload/execution/deposit/deposit_error.hpp>
#include <preload/execution/ethereum/core/contract/abi_decode.hpp>
#include <preload/execution/ethereum/core/contract/abi_encode.hpp>
#include <preload/execution/ethereum/core/contract/abi_signatures.hpp>
#include <preload/execution/ethereum/core/contract/events.hpp>
#include <preload/execution/ethereum/core/units.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <limits>

PRELOAD_ANONYMOUS_NAMESPACE_BEGIN

////////////////////////
// Function Selectors //
////////////////////////

struct PrecompileSelector
{
    static constexpr uint32_t DEPOSIT =
        abi_encode_selector("deposit(bytes,bytes,bytes,bytes32)");
    static constexpr uint32_t GET_DEPOSIT_ROOT =
        abi_encode_selector("get_deposit_root()");
    static constexpr uint32_t GET_DEPOSIT_COUNT =
        abi_encode_selector("get_deposit_count()");
};

constexpr size_t PUBKEY_LENGTH = 48;
constexpr size_t WITHDRAWAL_CREDENTIALS_LENGTH = 32;
constexpr size_t SIGNATURE_LENGTH = 96;

// zero_hashes[i] is the root of an empty subtree of height i
std::array<bytes32_t, DEPOSIT_CONTRACT_TREE_DEPTH> const &zero_hashes()
{
    static std::array<bytes32_t, DEPOSIT_CONTRACT_TREE_DEPTH> const hashes =
        [] {
            std::array<bytes32_t, DEPOSIT_CONTRACT_TREE_DEPTH> h{};
            for (size_t i = 0; i + 1 < DEPOSIT_CONTRACT_TREE_DEPTH; ++i) {
                h[i + 1] = sha256(h[i], h[i]);
            }
            return h;
        }();
    return hashes;
}

// little endian uint64, left aligned in a 32 byte chunk
bytes32_t to_little_endian_chunk(uint64_t const value)
{
    bytes32_t chunk{};
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
        chunk.bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return chunk;
}

byte_string to_little_endian_64(uint64_t const value)
{
    return byte_string{to_byte_string_view(to_little_endian_chunk(value))
                           .substr(0, sizeof(uint64_t))};
}

Result<void> function_not_payable(u256_be const &value)
{
    if (PRELOAD_UNLIKELY(!value.is_zero())) {
        return DepositError::ValueNonZero;
    }

    return outcome::success();
}

PRELOAD_ANONYMOUS_NAMESPACE_END

PRELOAD_NAMESPACE_BEGIN

bytes32_t deposit_data_root(
    byte_string_view const pubkey,
    byte_string_view const withdrawal_credentials, uint64_t const amount_gwei,
    byte_string_view const signature)
{
    PRELOAD_ASSERT(pubkey.size() == PUBKEY_LENGTH);
    PRELOAD_ASSERT(
        withdrawal_credentials.size() == WITHDRAWAL_CREDENTIALS_LENGTH);
    PRELOAD_ASSERT(signature.size() == SIGNATURE_LENGTH);

    byte_string padded_pubkey{pubkey};
    padded_pubkey.append(16, 0);
    bytes32_t const pubkey_root = sha256(padded_pubkey);

    bytes32_t const signature_low = sha256(signature.substr(0, 64));
    byte_string padded_signature_high{signature.substr(64)};
    padded_signature_high.append(32, 0);
    bytes32_t const signature_root =
        sha256(signature_low, sha256(padded_signature_high));

    return sha256(
        sha256(pubkey_root, to_bytes(withdrawal_credentials)),
        sha256(to_little_endian_chunk(amount_gwei), signature_root));
}

DepositContract::DepositContract(State &state, Address const &ca)
    : state_{state}
    , ca_{ca}
    , vars{state, ca}
{
}

Result<void> DepositContract::deposit(
    byte_string_view const pubkey,
    byte_string_view const withdrawal_credentials,
    byte_string_view const signature, bytes32_t const &root,
    uint256_t const &value)
{
    if (PRELOAD_UNLIKELY(pubkey.size() != PUBKEY_LENGTH)) {
        return DepositError::InvalidPubkeyLength;
    }
    if (PRELOAD_UNLIKELY(
            withdrawal_credentials.size() != WITHDRAWAL_CREDENTIALS_LENGTH)) {
        return DepositError::InvalidWithdrawalCredentialsLength;
    }
    if (PRELOAD_UNLIKELY(signature.size() != SIGNATURE_LENGTH)) {
        return DepositError::InvalidSignatureLength;
    }
    if (PRELOAD_UNLIKELY(value < ETHER)) {
        return DepositError::DepositValueTooLow;
    }
    if (PRELOAD_UNLIKELY(value % GWEI != 0)) {
        return DepositError::DepositValueNotMultipleOfGwei;
    }
    uint256_t const amount = value / GWEI;
    if (PRELOAD_UNLIKELY(amount > std::numeric_limits<uint64_t>::max())) {
        return DepositError::DepositValueTooHigh;
    }
    auto const amount_gwei = static_cast<uint64_t>(amount);

    if (PRELOAD_UNLIKELY(
            deposit_data_root(
                pubkey, withdrawal_credentials, amount_gwei, signature) !=
            root)) {
        return DepositError::DepositDataRootMismatch;
    }

    uint64_t const index = vars.deposit_count.load().native();
    if (PRELOAD_UNLIKELY(index >= MAX_DEPOSIT_COUNT)) {
        return DepositError::MerkleTreeFull;
    }

    emit_deposit_event(
        pubkey, withdrawal_credentials, amount_gwei, signature, index);

    uint64_t size = index + 1;
    vars.deposit_count.store(size);

    bytes32_t node = root;
    for (uint8_t height = 0; height < DEPOSIT_CONTRACT_TREE_DEPTH; ++height) {
        if ((size & 1) == 1) {
            vars.branch(height).store(node);
            return outcome::success();
        }
        node = sha256(vars.branch(height).load(), node);
        size /= 2;
    }

    // unreachable while size < 2^DEPOSIT_CONTRACT_TREE_DEPTH
    return DepositError::MerkleTreeFull;
}

bytes32_t DepositContract::get_deposit_root()
{
    auto const &zeros = zero_hashes();
    uint64_t const count = vars.deposit_count.load().native();

    bytes32_t node{};
    uint64_t size = count;
    for (uint8_t height = 0; height < DEPOSIT_CONTRACT_TREE_DEPTH; ++height) {
        if ((size & 1) == 1) {
            node = sha256(vars.branch(height).load(), node);
        }
        else {
            node = sha256(node, zeros[height]);
        }
        size /= 2;
    }
    return sha256(node, to_little_endian_chunk(count));
}

uint64_t DepositContract::get_deposit_count()
{
    return vars.deposit_count.load().native();
}

void DepositContract::emit_deposit_event(
    byte_string_view const pubkey,
    byte_string_view const withdrawal_credentials, uint64_t const amount_gwei,
    byte_string_view const signature, uint64_t const index)
{
    static constexpr auto signature_topic = abi_encode_event_signature(
        "DepositEvent(bytes,bytes,bytes,bytes,bytes)");

    AbiEncoder encoder;
    encoder.add_bytes(pubkey);
    encoder.add_bytes(withdrawal_credentials);
    encoder.add_bytes(to_little_endian_64(amount_gwei));
    encoder.add_bytes(signature);
    encoder.add_bytes(to_little_endian_64(index));

    auto const event = EventBuilder(ca_, signature_topic)
                           .add_data(encoder.encode_final())
                           .build();
    state_.store_log(event);
}

DepositContract::PrecompileFunc
DepositContract::precompile_dispatch(byte_string_view &input)
{
    if (PRELOAD_UNLIKELY(input.size() < 4)) {
        return &DepositContract::precompile_fallback;
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case PrecompileSelector::DEPOSIT:
        return &DepositContract::precompile_deposit;
    case PrecompileSelector::GET_DEPOSIT_ROOT:
        return &DepositContract::precompile_get_deposit_root;
    case PrecompileSelector::GET_DEPOSIT_COUNT:
        return &DepositContract::precompile_get_deposit_count;
    default:
        return &DepositContract::precompile_fallback;
    }
}

Result<byte_string> DepositContract::precompile_deposit(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    AbiDecoder decoder{input};
    auto const pubkey = BOOST_OUTCOME_TRYX(decoder.read_bytes());
    auto const withdrawal_credentials =
        BOOST_OUTCOME_TRYX(decoder.read_bytes());
    auto const signature = BOOST_OUTCOME_TRYX(decoder.read_bytes());
    auto const root = BOOST_OUTCOME_TRYX(decoder.read<bytes32_t>());

    BOOST_OUTCOME_TRY(deposit(
        pubkey,
        withdrawal_credentials,
        signature,
        root,
        intx::be::load<uint256_t>(msg_value)));
    return byte_string{};
}

Result<byte_string> DepositContract::precompile_get_deposit_root(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(u256_be::from_bytes(msg_value)));

    if (PRELOAD_UNLIKELY(!input.empty())) {
        return DepositError::InvalidInput;
    }

    return byte_string{to_byte_string_view(get_deposit_root())};
}

Result<byte_string> DepositContract::precompile_get_deposit_count(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(u256_be::from_bytes(msg_value)));

    if (PRELOAD_UNLIKELY(!input.empty())) {
        return DepositError::InvalidInput;
    }

    AbiEncoder encoder;
    encoder.add_bytes(to_little_endian_64(get_deposit_count()));
    return encoder.encode_final();
}

Result<byte_string> DepositContract::precompile_fallback(
    byte_string_view, evmc_address const &, evmc_bytes32 const &)
{
    return DepositError::MethodNotSupported;
}

PRELOAD_NAMESPACE_END
