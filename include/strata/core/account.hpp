#pragma once

#include <strata/config.hpp>
#include <strata/core/int.hpp>

#include <cstdint>

STRATA_NAMESPACE_BEGIN

struct Account
{
    uint256_t balance{0}; // sigma[a]_b
    uint64_t nonce{0}; // sigma[a]_n

    friend bool operator==(Account const &, Account const &) = default;
};

static_assert(sizeof(Account) == 40);
static_assert(alignof(Account) == 8);

STRATA_NAMESPACE_END
