#include <strata/evm/call_context.hpp>
#include <strata/evm/call_parameters.hpp>
#include <strata/evm/code_analysis.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/execution_state.hpp>
#include <strata/evm/system_state.hpp>
#include <strata/state/state.hpp>

#include <utility>

STRATA_EVM_NAMESPACE_BEGIN

ExecutionState::ExecutionState(
    State &state, CallContext const &context, CallParameters const &params,
    SharedCode code)
    : env{ExecutionEnvironment{
          .address = params.recipient,
          .sender = params.sender,
          .value = params.value,
          .input_data =
              is_create(params.kind) ? byte_string_view{} : params.input_data,
          .code = code,
          .depth = params.depth,
          .can_modify_state = params.can_modify_state,
          .is_create = is_create(params.kind),
          .context = context}}
    , mstate{MachineState{
          .gas_left = params.gas, .pc = 0, .memory = {}, .stack = {}}}
    , sstate{params.recipient, state}
    , last_return_data{}
    , return_data{}
    , gas_refund{0}
    , analysis{code ? byte_string_view{*code} : byte_string_view{}}
{
}

STRATA_EVM_NAMESPACE_END
