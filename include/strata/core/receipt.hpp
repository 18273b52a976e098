#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>

#include <vector>

STRATA_NAMESPACE_BEGIN

struct Log
{
    byte_string data{};
    std::vector<bytes32_t> topics{};
    Address address{};

    friend bool operator==(Log const &, Log const &) = default;
};

STRATA_NAMESPACE_END
