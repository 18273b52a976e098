#pragma once

#include <strata/config.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/host/host_store.hpp>

#include <cstddef>
#include <map>
#include <optional>

STRATA_NAMESPACE_BEGIN

class InMemoryHostStore final : public HostStore
{
public:
    using map_t = std::map<byte_string, byte_string, std::less<>>;

private:
    map_t data_{};
    size_t writes_{0};

public:
    InMemoryHostStore() = default;

    std::optional<byte_string> read(byte_string_view key) const override;
    void write(byte_string_view key, byte_string_view value) override;
    void remove(byte_string_view key) override;

    map_t const &data() const
    {
        return data_;
    }

    // number of write and remove calls since construction
    size_t writes() const
    {
        return writes_;
    }
};

STRATA_NAMESPACE_END
