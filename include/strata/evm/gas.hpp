#pragma once

#include <strata/core/address.hpp>
#include <strata/core/likely.h>
#include <strata/evm/config.hpp>
#include <strata/evm/execution_state.hpp>
#include <strata/evm/fee_schedule.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/status.hpp>

#include <cstdint>

STRATA_EVM_NAMESPACE_BEGIN

inline Status charge(ExecutionState &state, uint64_t const cost)
{
    if (STRATA_UNLIKELY(state.mstate.gas_left < cost)) {
        return Status::OutOfGas;
    }
    state.mstate.gas_left -= cost;
    return Status::Success;
}

// EIP-2929: the warm cost is part of the baseline, cold accounts pay the rest
template <Revision rev>
Status charge_account_access(ExecutionState &state, Address const &address)
{
    if constexpr (rev >= Revision::Berlin) {
        if (!state.sstate.access_account(address)) {
            return charge(state, additional_cold_account_access_cost<rev>);
        }
    }
    return Status::Success;
}

STRATA_EVM_NAMESPACE_END
