#pragma once

#include <strata/core/assert.h>
#include <strata/core/int.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/execution_state.hpp>
#include <strata/evm/fee_schedule.hpp>
#include <strata/evm/opcodes.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/stack_pointer.hpp>
#include <strata/evm/status.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <utility>

STRATA_EVM_NAMESPACE_BEGIN

// EIP-3855
template <Revision rev>
struct Trait<rev, Opcode::PUSH0>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Shanghai;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        sp.push(0);
        return Status::Success;
    }
};

template <Revision rev, Opcode op>
    requires(op >= Opcode::PUSH1 && op <= Opcode::PUSH32)
struct Trait<rev, op>
{
    // immediate bytes
    static constexpr size_t N =
        std::to_underlying(op) - std::to_underlying(Opcode::PUSH0);
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = N + 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        // the padding after the code covers a truncated immediate
        auto const &code = state.analysis.code();
        auto const pc = state.mstate.pc;
        STRATA_DEBUG_ASSERT(pc + N < code.size());

        uint8_t word[sizeof(uint256_t)] = {};
        std::memcpy(word + sizeof(word) - N, code.data() + pc + 1, N);
        sp.push(intx::be::load<uint256_t>(word));
        return Status::Success;
    }
};

STRATA_EVM_NAMESPACE_END
