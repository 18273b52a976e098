#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>

#include <optional>

STRATA_NAMESPACE_BEGIN

struct SignatureAndChain
{
    uint256_t r{};
    uint256_t s{};
    std::optional<uint256_t> chain_id{};
    bool odd_y_parity{};

    // false when v is neither 27/28 nor an EIP-155 value
    bool from_v(uint256_t const &);
};

static_assert(sizeof(SignatureAndChain) == 112);
static_assert(alignof(SignatureAndChain) == 8);

uint256_t get_v(SignatureAndChain const &) noexcept;

// ECDSA public key recovery over secp256k1
std::optional<Address>
recover_address(bytes32_t const &hash, SignatureAndChain const &);

STRATA_NAMESPACE_END
