#pragma once

#include <preload/core/basic_formatter.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

template <>
struct quill::copy_loggable<intx::uint256> : std::true_type
{
};

template <>
struct fmt::formatter<intx::uint256> : public preload::BasicFormatter
{
    template <typename FormatContext>
    auto format(intx::uint256 const &value, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "{}", intx::to_string(value));
        return ctx.out();
    }
};
