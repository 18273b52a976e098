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
struct Trait<rev, Opcode::STOP>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = zero_cost;

    static Status impl(StackPointer, ExecutionState const &)
    {
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::ADD>
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
        sp.push(a + b);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::MUL>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        sp.push(a * b);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SUB>
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
        sp.push(a - b);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::DIV>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        sp.push(b == 0 ? uint256_t{0} : a / b);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SDIV>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        sp.push(b == 0 ? uint256_t{0} : intx::sdivrem(a, b).quot);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::MOD>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        sp.push(b == 0 ? uint256_t{0} : a % b);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SMOD>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        sp.push(b == 0 ? uint256_t{0} : intx::sdivrem(a, b).rem);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::ADDMOD>
{
    static constexpr size_t stack_height_required = 3;
    static constexpr int stack_height_change = -2;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = mid_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        auto const &m = sp.pop();
        sp.push(m == 0 ? uint256_t{0} : intx::addmod(a, b, m));
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::MULMOD>
{
    static constexpr size_t stack_height_required = 3;
    static constexpr int stack_height_change = -2;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = mid_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &a = sp.pop();
        auto const &b = sp.pop();
        auto const &m = sp.pop();
        sp.push(m == 0 ? uint256_t{0} : intx::mulmod(a, b, m));
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::EXP>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = high_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        auto const &base = sp.pop();
        auto const &exponent = sp.pop();

        auto const cost =
            exp_byte_cost<rev>() * intx::count_significant_bytes(exponent);
        if (state.mstate.gas_left < cost) {
            return Status::OutOfGas;
        }
        state.mstate.gas_left -= cost;

        sp.push(intx::exp(base, exponent));
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SIGNEXTEND>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = low_cost;

    static Status impl(StackPointer sp, ExecutionState const &)
    {
        auto const &b = sp.pop();
        auto const &x = sp.pop();
        if (b >= 31) {
            sp.push(x);
            return Status::Success;
        }
        auto const sign_bit = static_cast<unsigned>(b) * 8 + 7;
        auto const mask = (uint256_t{2} << sign_bit) - 1;
        bool const negative = ((x >> sign_bit) & 1) != 0;
        sp.push(negative ? (x | ~mask) : (x & mask));
        return Status::Success;
    }
};

STRATA_EVM_NAMESPACE_END
