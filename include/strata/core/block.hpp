#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>

#include <cstdint>
#include <optional>

STRATA_NAMESPACE_BEGIN

// Block context visible to the interpreter
struct BlockHeader
{
    bytes32_t prev_randao{}; // mix_hash after the merge
    uint256_t difficulty{};
    Address beneficiary{};
    uint64_t number{0};
    uint64_t gas_limit{0};
    uint64_t timestamp{0};
    std::optional<uint256_t> base_fee_per_gas{std::nullopt}; // EIP-1559
};

STRATA_NAMESPACE_END
