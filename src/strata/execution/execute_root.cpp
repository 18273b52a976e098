#include <strata/config.hpp>
#include <strata/core/assert.h>
#include <strata/evm/call_context.hpp>
#include <strata/evm/call_parameters.hpp>
#include <strata/evm/execute.hpp>
#include <strata/evm/fee_schedule.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/status.hpp>
#include <strata/execution/execute_root.hpp>
#include <strata/execution/execution_outcome.hpp>
#include <strata/precompiles/precompile_registry.hpp>
#include <strata/state/state.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <utility>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

uint64_t max_refund_quotient(evm::Revision const rev)
{
    return rev >= evm::Revision::London
               ? evm::max_refund_quotient<evm::Revision::London>()
               : evm::max_refund_quotient<evm::Revision::Frontier>();
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

ExecutionOutcome execute_root(
    evm::Revision const rev, evm::CallContext const &context, State &state,
    evm::CallParameters const &params, uint64_t const intrinsic_gas)
{
    // EIP-2929
    if (rev >= evm::Revision::Berlin) {
        state.access_account(params.sender);
        if (!evm::is_create(params.kind)) {
            state.access_account(params.recipient);
        }
        for (auto const &address : context.precompiles.active_addresses(rev)) {
            state.access_account(address);
        }
    }
    // EIP-3651
    if (rev >= evm::Revision::Shanghai) {
        state.access_account(context.header.beneficiary);
    }

    auto result = evm::execute(rev, context, state, params);
    STRATA_ASSERT(result.gas_left <= params.gas);

    bool const success = result.status == evm::Status::Success;

    ExecutionOutcome outcome{
        .status = result.status,
        .gas_used = intrinsic_gas + params.gas - result.gas_left,
        .output = std::move(result.output),
        .logs = {},
        .diff = {},
        .created = {}};

    // EIP-3529
    if (success && result.gas_refund > 0) {
        auto const refund = std::min(
            static_cast<uint64_t>(result.gas_refund),
            outcome.gas_used / max_refund_quotient(rev));
        outcome.gas_used -= refund;
    }

    state.destruct_suicides();
    // EIP-161
    if (rev >= evm::Revision::SpuriousDragon) {
        state.destruct_touched_dead();
    }

    if (success) {
        outcome.logs = state.logs();
        if (evm::is_create(params.kind)) {
            outcome.created = result.create_address;
        }
    }

    LOG_DEBUG(
        "root call finished: {}, gas used {}, {} logs",
        evm::to_string(outcome.status),
        outcome.gas_used,
        outcome.logs.size());
    return outcome;
}

STRATA_NAMESPACE_END
