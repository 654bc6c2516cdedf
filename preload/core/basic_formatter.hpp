#pragma once

#include <preload/core/config.hpp>

#include <quill/bundled/fmt/format.h>

namespace fmt = fmtquill::v10;

PRELOAD_NAMESPACE_BEGIN

struct BasicFormatter
{
    constexpr auto parse(fmt::format_parse_context &ctx)
    {
        return ctx.begin();
    }
};

PRELOAD_NAMESPACE_END
