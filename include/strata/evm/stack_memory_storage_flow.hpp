#pragma once

#include <strata/core/assert.h>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/execution_state.hpp>
#include <strata/evm/fee_schedule.hpp>
#include <strata/evm/gas.hpp>
#include <strata/evm/opcodes.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/stack_pointer.hpp>
#include <strata/evm/status.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>

STRATA_EVM_NAMESPACE_BEGIN

template <Revision rev>
struct Trait<rev, Opcode::POP>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer, ExecutionState const &)
    {
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::MLOAD>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const &offset = sp.pop();

        if (auto const status = state.mstate.memory.expand(
                state.mstate.gas_left, offset, sizeof(uint256_t));
            status != Status::Success) {
            return status;
        }

        auto const src = state.mstate.memory.read(
            static_cast<size_t>(offset), sizeof(uint256_t));
        sp.push(intx::be::unsafe::load<uint256_t>(src.data()));
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::MSTORE>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -2;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const &offset = sp.pop();
        auto const &value = sp.pop();

        if (auto const status = state.mstate.memory.expand(
                state.mstate.gas_left, offset, sizeof(uint256_t));
            status != Status::Success) {
            return status;
        }

        auto const bytes = intx::be::store<bytes32_t>(value);
        state.mstate.memory.write(
            static_cast<size_t>(offset),
            sizeof(uint256_t),
            byte_string_view{bytes.bytes, sizeof(bytes32_t)});
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::MSTORE8>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -2;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const &offset = sp.pop();
        auto const &value = sp.pop();

        if (auto const status = state.mstate.memory.expand(
                state.mstate.gas_left, offset, 1);
            status != Status::Success) {
            return status;
        }

        unsigned char const byte = static_cast<unsigned char>(value[0]);
        state.mstate.memory.write(
            static_cast<size_t>(offset), 1, byte_string_view{&byte, 1});
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SLOAD>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = warm_access_cost<rev>();

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const key = sp.pop_bytes32();

        // EIP-2929
        if constexpr (rev >= Revision::Berlin) {
            if (!state.sstate.access_storage(key)) {
                if (auto const status =
                        charge(state, additional_cold_sload_cost<rev>);
                    status != Status::Success) {
                    return status;
                }
            }
        }

        sp.push_bytes32(state.sstate.get_storage(key));
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SSTORE>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -2;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = zero_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        if (!state.env.can_modify_state) {
            return Status::StaticModeViolation;
        }

        // EIP-2200 re-entrancy sentry
        if constexpr (rev >= Revision::Istanbul) {
            if (state.mstate.gas_left <= call_stipend) {
                return Status::OutOfGas;
            }
        }

        auto const key = sp.pop_bytes32();
        auto const value = sp.pop_bytes32();

        if constexpr (rev >= Revision::Berlin) {
            if (!state.sstate.access_storage(key)) {
                if (auto const status = charge(state, cold_sload_cost<rev>());
                    status != Status::Success) {
                    return status;
                }
            }
        }

        auto const status = state.sstate.set_storage(key, value);
        if (auto const charged = charge(state, sstore_cost<rev>(status));
            charged != Status::Success) {
            return charged;
        }
        state.gas_refund += sstore_refund<rev>(status);
        return Status::Success;
    }
};

// JUMP and JUMPI set pc themselves
template <Revision rev>
struct Trait<rev, Opcode::JUMP>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 0;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = mid_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const &dest = sp.pop();
        if (!state.analysis.is_jump_dest(dest)) {
            return Status::BadJumpDest;
        }
        state.mstate.pc = static_cast<size_t>(dest);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::JUMPI>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -2;
    static constexpr size_t pc_increment = 0;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = high_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const &dest = sp.pop();
        auto const &cond = sp.pop();
        if (!cond) {
            state.mstate.pc += 1;
            return Status::Success;
        }
        if (!state.analysis.is_jump_dest(dest)) {
            return Status::BadJumpDest;
        }
        state.mstate.pc = static_cast<size_t>(dest);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::PC>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.mstate.pc);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::MSIZE>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.mstate.memory.size());
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::GAS>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.mstate.gas_left);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::JUMPDEST>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = jumpdest_cost;

    static Status impl(StackPointer, ExecutionState const &)
    {
        return Status::Success;
    }
};

STRATA_EVM_NAMESPACE_END
