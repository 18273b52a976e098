#pragma once

#include <strata/core/bytes.hpp>
#include <strata/core/receipt.hpp>
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
#include <utility>

STRATA_EVM_NAMESPACE_BEGIN

template <Revision rev, Opcode op>
    requires(op >= Opcode::LOG0 && op <= Opcode::LOG4)
struct Trait<rev, op>
{
    static constexpr size_t N =
        std::to_underlying(op) - std::to_underlying(Opcode::LOG0);
    static constexpr size_t stack_height_required = N + 2;
    static constexpr int stack_height_change = -static_cast<int>(N + 2);
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = log_cost + N * log_topic_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        if (!state.env.can_modify_state) {
            return Status::StaticModeViolation;
        }

        auto const &offset = sp.pop();
        auto const &size = sp.pop();

        if (auto const status = state.mstate.memory.expand(
                state.mstate.gas_left, offset, size);
            status != Status::Success) {
            return status;
        }

        auto const size_z = static_cast<size_t>(size);
        if (auto const status = charge(state, size_z * log_data_cost);
            status != Status::Success) {
            return status;
        }

        Log log{.address = state.env.address};
        log.topics.reserve(N);
        for (size_t i = 0; i < N; ++i) {
            log.topics.emplace_back(sp.pop_bytes32());
        }
        if (size_z) {
            log.data = byte_string{state.mstate.memory.read(
                static_cast<size_t>(offset), size_z)};
        }
        state.sstate.store_log(log);
        return Status::Success;
    }
};

STRATA_EVM_NAMESPACE_END
