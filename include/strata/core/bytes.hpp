#pragma once

#include <strata/config.hpp>
#include <strata/core/assert.h>
#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/core/keccak.hpp>

#include <evmc/evmc.hpp>

#include <algorithm>
#include <bit>

STRATA_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

constexpr bytes32_t to_bytes(hash256 const n) noexcept
{
    return std::bit_cast<bytes32_t>(n);
}

constexpr bytes32_t to_bytes(byte_string_view const data) noexcept
{
    STRATA_ASSERT(data.size() <= sizeof(bytes32_t));

    bytes32_t byte;
    std::copy_n(
        data.begin(),
        data.size(),
        byte.bytes + sizeof(bytes32_t) - data.size());
    return byte;
}

inline byte_string_view to_byte_string_view(bytes32_t const &b)
{
    return {b.bytes, sizeof(b.bytes)};
}

using namespace evmc::literals;

inline constexpr bytes32_t NULL_HASH{
    0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32};

STRATA_NAMESPACE_END
