#pragma once

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

STRATA_EVM_NAMESPACE_BEGIN

template <Revision rev>
struct Trait<rev, Opcode::LT>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        sp.push(a < b);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::GT>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        sp.push(a > b);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SLT>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        sp.push(intx::slt(a, b));
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SGT>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        sp.push(intx::slt(b, a));
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::EQ>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        sp.push(a == b);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::ISZERO>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        sp.push(a == 0);
        return Status::Success;
    }
};

STRATA_EVM_NAMESPACE_END
