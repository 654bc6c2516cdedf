#pragma once

#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/execution/ethereum/core/address.hpp>

#include <cstdint>
#include <vector>

PRELOAD_NAMESPACE_BEGIN

struct Receipt
{
    enum Status : uint64_t
    {
        FAILED = 0,
        SUCCESS = 1,
    };

    struct Log
    {
        byte_string data{};
        std::vector<bytes32_t> topics{};
        Address address{};

        friend bool operator==(Log const &, Log const &) = default;
    };

    uint64_t status{FAILED};
    std::vector<Log> logs{};

    friend bool operator==(Receipt const &, Receipt const &) = default;
};

PRELOAD_NAMESPACE_END
