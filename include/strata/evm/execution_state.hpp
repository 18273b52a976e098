#pragma once

#include <strata/config.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/code_analysis.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/execution_environment.hpp>
#include <strata/evm/memory.hpp>
#include <strata/evm/stack_pointer.hpp>
#include <strata/evm/system_state.hpp>
#include <strata/state/account_state.hpp>

#include <cstddef>
#include <cstdint>

STRATA_NAMESPACE_BEGIN

class State;

STRATA_NAMESPACE_END

STRATA_EVM_NAMESPACE_BEGIN

struct CallContext;
struct CallParameters;

// 9.4.1
struct MachineState
{
    uint64_t gas_left; // g
    size_t pc; // pc
    Memory memory; // m
    uint256_t stack[stack_limit]; // s, shared by every frame of a root call
};

struct ExecutionState
{
    ExecutionEnvironment env;
    MachineState mstate;
    SystemState sstate;

    byte_string last_return_data; // H_return from last executed subcontext
    byte_string return_data; // H_return
    int64_t gas_refund;
    CodeAnalysis analysis;

    ExecutionState(
        State &, CallContext const &, CallParameters const &, SharedCode code);
};

STRATA_EVM_NAMESPACE_END
