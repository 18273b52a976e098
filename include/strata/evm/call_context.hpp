#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/block.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/config.hpp>

STRATA_NAMESPACE_BEGIN

class BlockHash;
class PrecompileRegistry;
struct HostContext;

STRATA_NAMESPACE_END

STRATA_EVM_NAMESPACE_BEGIN

// Shared by every frame of one root call
struct CallContext
{
    Address origin; // I_o
    uint256_t gas_price; // I_p
    uint256_t chain_id;
    BlockHeader header; // I_H
    BlockHash const &block_hash;
    PrecompileRegistry const &precompiles;
    HostContext const &host;
};

STRATA_EVM_NAMESPACE_END
