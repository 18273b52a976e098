#pragma once

#include <strata/core/assert.h>
#include <strata/core/keccak.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/execution_state.hpp>
#include <strata/evm/fee_schedule.hpp>
#include <strata/evm/gas.hpp>
#include <strata/evm/opcodes.hpp>
#include <strata/evm/stack_pointer.hpp>
#include <strata/evm/status.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>

STRATA_EVM_NAMESPACE_BEGIN

template <Revision rev>
struct Trait<rev, Opcode::KECCAK256>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = keccak256_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const &offset = sp.pop();
        auto const &size = sp.pop();

        if (auto const status = state.mstate.memory.expand(
                state.mstate.gas_left, offset, size);
            status != Status::Success) {
            return status;
        }

        auto const size_z = static_cast<size_t>(size);

        // H.1
        if (auto const status = charge(
                state, round_up_bytes_to_words(size_z) * keccak256_cost_per_word);
            status != Status::Success) {
            return status;
        }

        auto const data = size_z ? state.mstate.memory.read(
                                       static_cast<size_t>(offset), size_z)
                                 : byte_string_view{};
        sp.push(intx::be::load<uint256_t>(keccak256(data)));
        return Status::Success;
    }
};

STRATA_EVM_NAMESPACE_END
