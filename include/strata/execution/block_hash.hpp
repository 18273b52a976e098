#pragma once

#include <strata/config.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>

#include <cstdint>
#include <string>

STRATA_NAMESPACE_BEGIN

class BlockHash
{
public:
    static constexpr unsigned N = 256;

    virtual bytes32_t get(uint64_t) const = 0;
    virtual ~BlockHash() = default;
};

// The host exposes no block hashes, so they are derived from the chain id,
// the engine account and the block number.
class DerivedBlockHash : public BlockHash
{
    uint256_t chain_id_;
    std::string account_id_;

public:
    DerivedBlockHash(uint256_t const &chain_id, std::string account_id);

    bytes32_t get(uint64_t) const override;
};

bytes32_t compute_block_hash(
    uint256_t const &chain_id, std::string_view account_id, uint64_t number);

STRATA_NAMESPACE_END
