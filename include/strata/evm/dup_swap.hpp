#pragma once

#include <strata/evm/config.hpp>
#include <strata/evm/execution_state.hpp>
#include <strata/evm/fee_schedule.hpp>
#include <strata/evm/opcodes.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/stack_pointer.hpp>
#include <strata/evm/status.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>

STRATA_EVM_NAMESPACE_BEGIN

// distance of op from the first opcode of its group, counting from 1
template <Opcode first, Opcode op>
constexpr size_t group_index =
    std::to_underlying(op) - std::to_underlying(first) + 1;

template <Revision rev, Opcode op>
    requires(op >= Opcode::DUP1 && op <= Opcode::DUP16)
struct Trait<rev, op>
{
    static constexpr size_t N = group_index<Opcode::DUP1, op>;
    static constexpr size_t stack_height_required = N;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        sp.push(sp.at(N - 1));
        return Status::Success;
    }
};

template <Revision rev, Opcode op>
    requires(op >= Opcode::SWAP1 && op <= Opcode::SWAP16)
struct Trait<rev, op>
{
    static constexpr size_t N = group_index<Opcode::SWAP1, op>;
    static constexpr size_t stack_height_required = N + 1;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        std::swap(sp.at(0), sp.at(N));
        return Status::Success;
    }
};

STRATA_EVM_NAMESPACE_END
