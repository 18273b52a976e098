#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/core/signature.hpp>

#include <cstdint>
#include <optional>

STRATA_NAMESPACE_BEGIN

// Legacy (pre EIP-2718) transaction, optionally EIP-155 replay protected
struct Transaction
{
    SignatureAndChain sc{};
    uint64_t nonce{};
    uint256_t gas_price{};
    uint64_t gas_limit{};
    std::optional<Address> to{};
    uint256_t value{};
    byte_string data{};
};

std::optional<Address> recover_sender(Transaction const &);

STRATA_NAMESPACE_END
