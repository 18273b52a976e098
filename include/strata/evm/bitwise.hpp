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
struct Trait<rev, Opcode::AND>
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
        sp.push(a & b);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::OR>
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
        sp.push(a | b);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::XOR>
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
        sp.push(a ^ b);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::NOT>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        sp.push(~a);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::BYTE>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &i = sp.pop();
        auto const &x = sp.pop();
        if (i >= 32) {
            sp.push(0);
            return Status::Success;
        }
        auto const shift = (31 - static_cast<unsigned>(i)) * 8;
        sp.push((x >> shift) & 0xff);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SHL>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Constantinople;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &shift = sp.pop();
        auto const &value = sp.pop();
        sp.push(shift < 256 ? value << shift : uint256_t{0});
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SHR>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Constantinople;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &shift = sp.pop();
        auto const &value = sp.pop();
        sp.push(shift < 256 ? value >> shift : uint256_t{0});
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SAR>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Constantinople;
    static constexpr uint64_t baseline_cost = very_low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &shift = sp.pop();
        auto const &value = sp.pop();
        bool const negative = (value >> 255) != 0;
        if (shift >= 256) {
            sp.push(negative ? ~uint256_t{0} : uint256_t{0});
            return Status::Success;
        }
        sp.push(negative ? ~((~value) >> shift) : value >> shift);
        return Status::Success;
    }
};

STRATA_EVM_NAMESPACE_END
