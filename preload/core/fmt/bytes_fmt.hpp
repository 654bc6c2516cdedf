#pragma once

#include <preload/core/basic_formatter.hpp>
#include <preload/core/byte_string.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

template <>
struct quill::copy_loggable<evmc::bytes32> : std::true_type
{
};

template <>
struct fmt::formatter<evmc::bytes32> : public preload::BasicFormatter
{
    template <typename FormatContext>
    auto format(evmc::bytes32 const &value, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "0x{}",
            evmc::hex({value.bytes, sizeof(value.bytes)}));
        return ctx.out();
    }
};

template <>
struct fmt::formatter<preload::byte_string> : public preload::BasicFormatter
{
    template <typename FormatContext>
    auto format(preload::byte_string const &value, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(), "0x{}", evmc::hex({value.data(), value.size()}));
        return ctx.out();
    }
};
