#pragma once

#include <strata/config.hpp>
#include <strata/core/byte_string.hpp>

#include <ethash/hash_types.hpp>
#include <ethash/keccak.hpp>

STRATA_NAMESPACE_BEGIN

using hash256 = ethash::hash256;

inline hash256 keccak256(byte_string_view const bytes)
{
    return ethash::keccak256(bytes.data(), bytes.size());
}

inline hash256 keccak256(std::string_view const s)
{
    return keccak256(to_byte_string_view(s));
}

STRATA_NAMESPACE_END
