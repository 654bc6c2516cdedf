#pragma once

#include <preload/core/basic_formatter.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

template <>
struct quill::copy_loggable<evmc::address> : std::true_type
{
};

template <>
struct fmt::formatter<evmc::address> : public preload::BasicFormatter
{
    template <typename FormatContext>
    auto format(evmc::address const &value, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "0x{}",
            evmc::hex({value.bytes, sizeof(value.bytes)}));
        return ctx.out();
    }
};
