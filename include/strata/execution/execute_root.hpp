#pragma once

#include <strata/config.hpp>
#include <strata/evm/revision.hpp>
#include <strata/execution/execution_outcome.hpp>

#include <cstdint>

STRATA_NAMESPACE_BEGIN

class State;

namespace evm
{
    struct CallContext;
    struct CallParameters;
}

// Runs a root message inside an open root overlay, then destroys the
// accounts scheduled by SELFDESTRUCT, drops touched empty accounts and caps
// the refund. intrinsic_gas was charged before the message and counts towards
// gas used. The caller commits or discards the root overlay.
ExecutionOutcome execute_root(
    evm::Revision, evm::CallContext const &, State &,
    evm::CallParameters const &, uint64_t intrinsic_gas = 0);

STRATA_NAMESPACE_END
