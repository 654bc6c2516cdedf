#pragma once

#include <preload/core/basic_formatter.hpp>
#include <preload/core/fmt/address_fmt.hpp>
#include <preload/core/fmt/bytes_fmt.hpp>
#include <preload/execution/ethereum/core/receipt.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

template <>
struct fmt::formatter<preload::Receipt::Log> : public preload::BasicFormatter
{
    template <typename FormatContext>
    auto format(preload::Receipt::Log const &l, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "Log{{"
            "Address={} "
            "Topics=[{}] "
            "Data={}"
            "}}",
            l.address,
            fmt::join(l.topics, ", "),
            l.data);
        return ctx.out();
    }
};
