#pragma once

#include <preload/core/basic_formatter.hpp>
#include <preload/core/fmt/bytes_fmt.hpp>
#include <preload/execution/batch/util/deposit_record.hpp>

#include <evmc/hex.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

template <>
struct quill::copy_loggable<preload::DepositRecord> : std::true_type
{
};

template <>
struct fmt::formatter<preload::DepositRecord> : public preload::BasicFormatter
{
    template <typename FormatContext>
    auto format(preload::DepositRecord const &r, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "DepositRecord{{"
            "Pubkey=0x{} "
            "Withdrawal Credentials=0x{} "
            "Signature=0x{} "
            "Deposit Data Root={}"
            "}}",
            evmc::hex(preload::pubkey_of(r)),
            evmc::hex(preload::withdrawal_credentials_of(r)),
            evmc::hex(preload::signature_of(r)),
            r.deposit_data_root);
        return ctx.out();
    }
};
