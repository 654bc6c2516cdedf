#pragma once

#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>
#include <preload/execution/ethereum/core/address.hpp>
#include <preload/execution/ethereum/core/receipt.hpp>

#include <utility>

PRELOAD_NAMESPACE_BEGIN

class EventBuilder
{
    Receipt::Log event_;

public:
    explicit EventBuilder(Address const &account, bytes32_t const &signature)
    {
        event_.address = account;
        event_.topics.push_back(signature);
    }

    // indexed parameter
    EventBuilder &add_topic(bytes32_t const &topic)
    {
        event_.topics.push_back(topic);
        return *this;
    }

    // non-indexed parameters, already abi encoded
    EventBuilder &add_data(byte_string_view const data)
    {
        event_.data += data;
        return *this;
    }

    EventBuilder &add_data(bytes32_t const &word)
    {
        return add_data(to_byte_string_view(word));
    }

    Receipt::Log build()
    {
        return std::move(event_);
    }
};

PRELOAD_NAMESPACE_END
