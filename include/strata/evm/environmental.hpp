#pragma once

#include <strata/core/address.hpp>
#include <strata/core/assert.h>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/call_context.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/execution_state.hpp>
#include <strata/evm/fee_schedule.hpp>
#include <strata/evm/gas.hpp>
#include <strata/evm/opcodes.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/stack_pointer.hpp>
#include <strata/evm/status.hpp>
#include <strata/state/state.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>

STRATA_EVM_NAMESPACE_BEGIN

// Shared by the *COPY opcodes: charges memory expansion and the copy cost,
// then copies src[src_offset...] zero padding past its end
inline Status copy_to_memory(
    ExecutionState &state, uint256_t const &mem_offset,
    uint256_t const &src_offset, uint256_t const &size,
    byte_string_view const src)
{
    if (auto const status = state.mstate.memory.expand(
            state.mstate.gas_left, mem_offset, size);
        status != Status::Success) {
        return status;
    }

    auto const size_z = static_cast<size_t>(size);
    if (auto const status = charge(state, copy_cost(size_z));
        status != Status::Success) {
        return status;
    }

    if (size_z) {
        state.mstate.memory.write_padded(
            static_cast<size_t>(mem_offset), size_z, src, src_offset);
    }
    return Status::Success;
}

template <Revision rev>
struct Trait<rev, Opcode::ADDRESS>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push_address(state.env.address);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::BALANCE>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = balance_cost<rev>();

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const address = sp.pop_address();
        if (auto const status = charge_account_access<rev>(state, address);
            status != Status::Success) {
            return status;
        }
        sp.push_bytes32(state.sstate.get_balance(address));
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::ORIGIN>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push_address(state.env.context.origin);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::CALLER>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push_address(state.env.sender);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::CALLVALUE>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.env.value);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::CALLDATALOAD>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        auto const &i = sp.pop();
        if (i >= state.env.input_data.size()) {
            sp.push(0);
        }
        else {
            auto const sv = state.env.input_data.substr(
                static_cast<size_t>(i), sizeof(bytes32_t));
            bytes32_t bytes{};
            std::copy_n(sv.data(), sv.size(), bytes.bytes);
            // YP Appendix H: When interpreting 256-bit binary values as
            // integers, the representation is big-endian.
            sp.push(intx::be::load<uint256_t>(bytes));
        }
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::CALLDATASIZE>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.env.input_data.size());
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::CALLDATACOPY>
{
    static constexpr size_t stack_height_required = 3;
    static constexpr int stack_height_change = -3;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const &mem_offset = sp.pop();
        auto const &data_offset = sp.pop();
        auto const &size = sp.pop();
        return copy_to_memory(
            state, mem_offset, data_offset, size, state.env.input_data);
    }
};

template <Revision rev>
struct Trait<rev, Opcode::CODESIZE>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.env.code ? state.env.code->size() : 0);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::CODECOPY>
{
    static constexpr size_t stack_height_required = 3;
    static constexpr int stack_height_change = -3;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const &mem_offset = sp.pop();
        auto const &code_offset = sp.pop();
        auto const &size = sp.pop();
        return copy_to_memory(
            state,
            mem_offset,
            code_offset,
            size,
            state.env.code ? byte_string_view{*state.env.code}
                           : byte_string_view{});
    }
};

template <Revision rev>
struct Trait<rev, Opcode::GASPRICE>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.env.context.gas_price);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::EXTCODESIZE>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = extcode_cost<rev>();

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const address = sp.pop_address();
        if (auto const status = charge_account_access<rev>(state, address);
            status != Status::Success) {
            return status;
        }
        auto const code = state.sstate.state().get_code(address);
        sp.push(code ? code->size() : 0);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::EXTCODECOPY>
{
    static constexpr size_t stack_height_required = 4;
    static constexpr int stack_height_change = -4;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = extcode_cost<rev>();

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const address = sp.pop_address();
        auto const &mem_offset = sp.pop();
        auto const &code_offset = sp.pop();
        auto const &size = sp.pop();
        if (auto const status = charge_account_access<rev>(state, address);
            status != Status::Success) {
            return status;
        }
        auto const code = state.sstate.state().get_code(address);
        return copy_to_memory(
            state,
            mem_offset,
            code_offset,
            size,
            code ? byte_string_view{*code} : byte_string_view{});
    }
};

template <Revision rev>
struct Trait<rev, Opcode::RETURNDATASIZE>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Byzantium;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.last_return_data.size());
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::RETURNDATACOPY>
{
    static constexpr size_t stack_height_required = 3;
    static constexpr int stack_height_change = -3;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Byzantium;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const &mem_offset = sp.pop();
        auto const &data_offset = sp.pop();
        auto const &size = sp.pop();
        if (data_offset > state.last_return_data.size() ||
            size > state.last_return_data.size() - data_offset) {
            return Status::InvalidMemoryAccess;
        }
        return copy_to_memory(
            state, mem_offset, data_offset, size, state.last_return_data);
    }
};

template <Revision rev>
struct Trait<rev, Opcode::EXTCODEHASH>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Constantinople;
    static constexpr uint64_t baseline_cost = extcodehash_cost<rev>();

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const address = sp.pop_address();
        if (auto const status = charge_account_access<rev>(state, address);
            status != Status::Success) {
            return status;
        }
        auto &world = state.sstate.state();
        if (world.account_is_dead(address)) {
            sp.push(0);
        }
        else {
            sp.push_bytes32(world.get_code_hash(address));
        }
        return Status::Success;
    }
};

STRATA_EVM_NAMESPACE_END
