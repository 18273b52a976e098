#pragma once

#include <strata/config.hpp>
#include <strata/evm/revision.hpp>

#include <cstdint>

STRATA_NAMESPACE_BEGIN

struct Transaction;

// YP Eqn. 60 under the rules of the given revision
uint64_t intrinsic_gas(evm::Revision, Transaction const &) noexcept;

STRATA_NAMESPACE_END
