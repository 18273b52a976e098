#pragma once

#include <strata/config.hpp>
#include <strata/core/byte_string.hpp>

#include <optional>

STRATA_NAMESPACE_BEGIN

// Persistent key-value storage supplied by the host runtime
class HostStore
{
public:
    virtual ~HostStore() = default;

    virtual std::optional<byte_string> read(byte_string_view key) const = 0;
    virtual void write(byte_string_view key, byte_string_view value) = 0;
    virtual void remove(byte_string_view key) = 0;

    bool contains(byte_string_view const key) const
    {
        return read(key).has_value();
    }
};

STRATA_NAMESPACE_END
