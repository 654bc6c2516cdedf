#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/fmt/address_fmt.hpp>
#include <preload/core/fmt/bytes_fmt.hpp>
#include <preload/core/fmt/int_fmt.hpp>
#include <preload/core/int.hpp>
#include <preload/core/log_level_map.hpp>
#include <preload/execution/batch/batch_deposit_contract.hpp>
#include <preload/execution/batch/deposit_data_file.hpp>
#include <preload/execution/batch/fmt/deposit_record_fmt.hpp>
#include <preload/execution/batch/native_deposit_acceptor.hpp>
#include <preload/execution/batch/util/constants.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>
#include <preload/execution/deposit/deposit_contract.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/contract/abi_decode.hpp>
#include <preload/execution/ethereum/core/contract/abi_encode.hpp>
#include <preload/execution/ethereum/core/contract/abi_signatures.hpp>
#include <preload/execution/ethereum/core/fmt/receipt_fmt.hpp>
#include <preload/execution/ethereum/execute_transaction.hpp>
#include <preload/execution/ethereum/state3/state.hpp>

#include <CLI/CLI.hpp>
#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>
#include <quill/bundled/fmt/core.h>
#include <quill/bundled/fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace preload;

namespace
{
    constexpr auto DEFAULT_OWNER{
        0x00000000000000000000000000000000000a11ce_address};

    class Simulation
    {
        State &state_;

    public:
        explicit Simulation(State &state)
            : state_{state}
        {
        }

        // Runs one call and reports a failure with its revert reason.
        bool transact(
            std::string const &what, Address const &from,
            Address const &to, byte_string const &input,
            uint256_t const &value)
        {
            evmc_message const msg{
                .kind = EVMC_CALL,
                .flags = 0,
                .depth = 0,
                .gas = 30'000'000,
                .recipient = to,
                .sender = from,
                .input_data = input.data(),
                .input_size = input.size(),
                .value = intx::be::store<evmc_uint256be>(value),
                .create2_salt = {},
                .code_address = to,
                .code = nullptr,
                .code_size = 0,
            };
            auto const outcome = execute_transaction(state_, msg);
            if (outcome.result.status_code != EVMC_SUCCESS) {
                LOG_ERROR(
                    "{} failed with status {}: {}",
                    what,
                    static_cast<int>(outcome.result.status_code),
                    revert_reason(outcome.result));
                return false;
            }
            for (auto const &log : outcome.receipt.logs) {
                fmt::println("  {}", log);
            }
            return true;
        }

        static std::string revert_reason(evmc::Result const &result)
        {
            byte_string_view output{result.output_data, result.output_size};
            // Error(string) selector
            if (output.size() < 4) {
                return {};
            }
            output.remove_prefix(4);
            AbiDecoder decoder{output};
            auto const reason = decoder.read_bytes();
            if (reason.has_error()) {
                return {};
            }
            return std::string{
                reinterpret_cast<char const *>(reason.value().data()),
                reason.value().size()};
        }
    };

    byte_string with_selector(std::string_view const signature)
    {
        byte_string input(4, 0);
        intx::be::unsafe::store(input.data(), abi_encode_selector(signature));
        return input;
    }

    byte_string encode_add_deposit_data(
        Address const &beneficiary, std::span<DepositRecord const> records)
    {
        std::vector<byte_string> pubkeys;
        std::vector<byte_string> withdrawal_credentials;
        std::vector<byte_string> signatures;
        std::vector<bytes32_t> deposit_data_roots;
        for (auto const &record : records) {
            pubkeys.emplace_back(pubkey_of(record));
            withdrawal_credentials.emplace_back(
                withdrawal_credentials_of(record));
            signatures.emplace_back(signature_of(record));
            deposit_data_roots.push_back(record.deposit_data_root);
        }

        AbiEncoder encoder;
        encoder.add_address(beneficiary);
        encoder.add_bytes_array(pubkeys);
        encoder.add_bytes_array(withdrawal_credentials);
        encoder.add_bytes_array(signatures);
        encoder.add_bytes32_array(deposit_data_roots);
        byte_string const selector = with_selector(
            "addDepositData(address,bytes[],bytes[],bytes[],bytes32[])");
        return selector + encoder.encode_final();
    }

    std::optional<Address> parse_address(std::string const &s)
    {
        return evmc::from_hex<Address>(s);
    }
}

int main(int argc, char *argv[])
{
    std::filesystem::path deposit_data;
    std::string beneficiary_hex;
    std::string owner_hex =
        evmc::hex({DEFAULT_OWNER.bytes, sizeof(DEFAULT_OWNER.bytes)});
    bool trigger = false;
    std::optional<uint64_t> delete_last = std::nullopt;
    bool pause = false;
    auto log_level = quill::LogLevel::Info;

    CLI::App cli{"preload_cli"};
    cli.add_option(
           "--deposit-data",
           deposit_data,
           "deposit-cli json file, or the batched json layout")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option(
           "--beneficiary",
           beneficiary_hex,
           "address allowed to trigger the staged deposits")
        ->required();
    cli.add_option("--owner", owner_hex, "operator address");
    cli.add_flag(
        "--trigger", trigger, "send the exact collateral from the beneficiary");
    cli.add_option(
        "--delete-last",
        delete_last,
        "drop the n most recently staged records");
    cli.add_flag("--pause", pause, "pause the contract before triggering");
    cli.add_option("--log-level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto const beneficiary = parse_address(beneficiary_hex);
    auto const owner = parse_address(owner_hex);
    if (!beneficiary.has_value() || !owner.has_value()) {
        LOG_ERROR("invalid address: {} / {}", beneficiary_hex, owner_hex);
        quill::flush();
        return 1;
    }

    auto const records = load_deposit_data_file(deposit_data);
    if (records.has_error()) {
        LOG_ERROR(
            "failed to load {}: {}",
            deposit_data.string(),
            records.error().message().c_str());
        quill::flush();
        return 1;
    }
    fmt::println(
        "Loaded {} records from {}",
        records.value().size(),
        deposit_data.string());

    State state{};
    {
        NativeDepositAcceptor acceptor{state, BATCH_DEPOSIT_CA};
        BatchDepositContract contract{state, acceptor};
        auto const res =
            contract.initialize(owner.value(), DEPOSIT_CONTRACT_ADDRESS);
        if (res.has_error()) {
            LOG_ERROR(
                "initialize failed: {}", res.error().message().c_str());
            quill::flush();
            return 1;
        }
    }
    uint256_t const funding = records.value().size() * COLLATERAL;
    state.add_to_balance(beneficiary.value(), funding);
    fmt::println(
        "Batch contract {} owned by {}, beneficiary {} funded with {} wei",
        BATCH_DEPOSIT_CA,
        owner.value(),
        beneficiary.value(),
        funding);

    Simulation sim{state};
    std::span<DepositRecord const> pending{records.value()};
    while (!pending.empty()) {
        auto const n = std::min<size_t>(pending.size(), MAX_RECORDS_PER_ADD);
        fmt::println("addDepositData with {} records", n);
        if (!sim.transact(
                "addDepositData",
                owner.value(),
                BATCH_DEPOSIT_CA,
                encode_add_deposit_data(
                    beneficiary.value(), pending.first(n)),
                0)) {
            quill::flush();
            return 1;
        }
        pending = pending.subspan(n);
    }

    if (delete_last.has_value()) {
        AbiEncoder encoder;
        encoder.add_address(beneficiary.value());
        encoder.add_int(u256_be{uint256_t{delete_last.value()}});
        fmt::println("deleteLastnDepositEntries({})", delete_last.value());
        if (!sim.transact(
                "deleteLastnDepositEntries",
                owner.value(),
                BATCH_DEPOSIT_CA,
                with_selector("deleteLastnDepositEntries(address,uint256)") +
                    encoder.encode_final(),
                0)) {
            quill::flush();
            return 1;
        }
    }

    if (pause) {
        fmt::println("pause()");
        if (!sim.transact(
                "pause",
                owner.value(),
                BATCH_DEPOSIT_CA,
                with_selector("pause()"),
                0)) {
            quill::flush();
            return 1;
        }
    }

    std::vector<DepositRecord> staged;
    {
        NativeDepositAcceptor acceptor{state, BATCH_DEPOSIT_CA};
        BatchDepositContract contract{state, acceptor};
        staged = contract.get_staker_data(beneficiary.value());
    }
    fmt::println(
        "getStakerData({}): {} records", beneficiary.value(), staged.size());
    for (auto const &record : staged) {
        fmt::println("  {}", record);
    }

    if (trigger) {
        uint256_t const value = staged.size() * COLLATERAL;
        fmt::println("trigger with {} wei", value);
        if (!sim.transact(
                "trigger",
                beneficiary.value(),
                BATCH_DEPOSIT_CA,
                byte_string{},
                value)) {
            quill::flush();
            return 1;
        }
    }

    DepositContract deposit_contract{state};
    fmt::println(
        "Deposit contract {}: count={} root={}",
        DEPOSIT_CONTRACT_ADDRESS,
        deposit_contract.get_deposit_count(),
        deposit_contract.get_deposit_root());

    quill::flush();
    return 0;
}
