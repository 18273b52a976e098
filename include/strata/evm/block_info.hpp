#pragma once

#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/call_context.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/execution_state.hpp>
#include <strata/evm/fee_schedule.hpp>
#include <strata/evm/opcodes.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/stack_pointer.hpp>
#include <strata/evm/status.hpp>
#include <strata/execution/block_hash.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>

STRATA_EVM_NAMESPACE_BEGIN

template <Revision rev>
struct Trait<rev, Opcode::BLOCKHASH>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = 0;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = blockhash_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        auto const &number = sp.pop();
        auto const upper_bound = state.env.context.header.number;
        auto const lower_bound =
            upper_bound > BlockHash::N ? upper_bound - BlockHash::N : 0;
        auto const hash =
            (number < upper_bound && number >= lower_bound)
                ? state.env.context.block_hash.get(
                      static_cast<uint64_t>(number))
                : bytes32_t{};
        sp.push_bytes32(hash);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::COINBASE>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push_address(state.env.context.header.beneficiary);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::TIMESTAMP>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.env.context.header.timestamp);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::NUMBER>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.env.context.header.number);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::PREVRANDAO>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        // DIFFICULTY before the merge
        if constexpr (rev >= Revision::Paris) {
            sp.push_bytes32(state.env.context.header.prev_randao);
        }
        else {
            sp.push(state.env.context.header.difficulty);
        }
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::GASLIMIT>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.env.context.header.gas_limit);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::CHAINID>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Istanbul;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.env.context.chain_id);
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SELFBALANCE>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Istanbul;
    static constexpr uint64_t baseline_cost = low_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        sp.push_bytes32(state.sstate.self_balance());
        return Status::Success;
    }
};

template <Revision rev>
struct Trait<rev, Opcode::BASEFEE>
{
    static constexpr size_t stack_height_required = 0;
    static constexpr int stack_height_change = 1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::London;
    static constexpr uint64_t baseline_cost = base_cost;

    static Status impl(StackPointer sp, ExecutionState const &state)
    {
        sp.push(state.env.context.header.base_fee_per_gas.value_or(0));
        return Status::Success;
    }
};

STRATA_EVM_NAMESPACE_END
