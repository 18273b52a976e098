#pragma once

#include <strata/config.hpp>
#include <strata/core/byte_string.hpp>

#include <evmc/evmc.hpp>

#include <string_view>

STRATA_NAMESPACE_BEGIN

using Address = ::evmc::address;

static_assert(sizeof(Address) == 20);
static_assert(alignof(Address) == 1);

inline byte_string_view to_byte_string_view(Address const &a)
{
    return {a.bytes, sizeof(a.bytes)};
}

// last 20 bytes of keccak256 of the host account id
Address host_account_to_address(std::string_view account_id);

STRATA_NAMESPACE_END
