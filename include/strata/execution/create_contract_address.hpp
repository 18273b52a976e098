#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/keccak.hpp>

#include <cstdint>

STRATA_NAMESPACE_BEGIN

Address create_contract_address(Address const &from, uint64_t nonce);

Address create2_contract_address(
    Address const &from, bytes32_t const &salt, hash256 const &code_hash);

STRATA_NAMESPACE_END
