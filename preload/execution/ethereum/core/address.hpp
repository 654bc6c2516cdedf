#pragma once

#include <preload/core/config.hpp>

#include <evmc/evmc.hpp>

PRELOAD_NAMESPACE_BEGIN

using Address = ::evmc::address;

static_assert(sizeof(Address) == 20);
static_assert(alignof(Address) == 1);

PRELOAD_NAMESPACE_END
