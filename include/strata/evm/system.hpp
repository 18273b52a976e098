#pragma once

#include <strata/core/address.hpp>
#include <strata/core/assert.h>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/call_parameters.hpp>
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
#include <limits>
#include <optional>
#include <utility>

STRATA_EVM_NAMESPACE_BEGIN

// A message requested by a CALL or CREATE family opcode; the dispatcher
// decides whether it runs as a new frame
struct PendingCall
{
    CallParameters params;
    size_t ret_offset;
    size_t ret_size;
};

constexpr bool is_call_opcode(Opcode const op)
{
    return op == Opcode::CALL || op == Opcode::CALLCODE ||
           op == Opcode::DELEGATECALL || op == Opcode::STATICCALL;
}

constexpr bool is_create_opcode(Opcode const op)
{
    return op == Opcode::CREATE || op == Opcode::CREATE2;
}

inline uint64_t saturating_u64(uint256_t const &x)
{
    return x > std::numeric_limits<uint64_t>::max()
               ? std::numeric_limits<uint64_t>::max()
               : static_cast<uint64_t>(x);
}

template <Revision rev, Opcode op>
    requires(is_call_opcode(op))
std::optional<PendingCall>
pre_call(StackPointer &sp, ExecutionState &state, Status &status)
{
    auto const gas = sp.pop();
    auto const address = sp.pop_address();
    uint256_t const value =
        (op == Opcode::STATICCALL || op == Opcode::DELEGATECALL) ? 0
                                                                  : sp.pop();
    auto const args_offset = sp.pop();
    auto const args_size = sp.pop();
    auto const ret_offset = sp.pop();
    auto const ret_size = sp.pop();

    state.last_return_data.clear();

    // EIP-2929
    status = charge_account_access<rev>(state, address);
    if (status != Status::Success) {
        return std::nullopt;
    }

    status = state.mstate.memory.expand(
        state.mstate.gas_left, args_offset, args_size);
    if (status != Status::Success) {
        return std::nullopt;
    }

    status = state.mstate.memory.expand(
        state.mstate.gas_left, ret_offset, ret_size);
    if (status != Status::Success) {
        return std::nullopt;
    }

    if constexpr (op == Opcode::CALL) {
        // CALLCODE is not checked, matching geth
        if (value && !state.env.can_modify_state) {
            status = Status::StaticModeViolation;
            return std::nullopt;
        }
    }

    auto const cost = [&] {
        uint64_t ret = value ? call_value_cost : 0;
        if constexpr (op == Opcode::CALL) {
            auto &world = state.sstate.state();
            if constexpr (rev >= Revision::SpuriousDragon) {
                // EIP-161
                if (value && world.account_is_dead(address)) {
                    ret += new_account_cost;
                }
            }
            else if (!world.account_exists(address)) {
                ret += new_account_cost;
            }
        }
        return ret;
    }();
    status = charge(state, cost);
    if (status != Status::Success) {
        return std::nullopt;
    }

    auto gas_u = saturating_u64(gas);
    // EIP-150
    if constexpr (rev >= Revision::TangerineWhistle) {
        gas_u =
            std::min(gas_u, state.mstate.gas_left - state.mstate.gas_left / 64);
    }
    else if (state.mstate.gas_left < gas_u) {
        status = Status::OutOfGas;
        return std::nullopt;
    }
    if (value) {
        gas_u += call_stipend;
        state.mstate.gas_left += call_stipend;
    }

    auto const args_size_z = static_cast<size_t>(args_size);
    auto const ret_size_z = static_cast<size_t>(ret_size);
    CallParameters params{
        .kind = op == Opcode::CALL         ? CallKind::Call
                : op == Opcode::CALLCODE   ? CallKind::CallCode
                : op == Opcode::DELEGATECALL ? CallKind::DelegateCall
                                             : CallKind::StaticCall,
        .sender =
            op == Opcode::DELEGATECALL ? state.env.sender : state.env.address,
        .recipient = (op == Opcode::CALL || op == Opcode::STATICCALL)
                         ? address
                         : state.env.address,
        .code_address = address,
        .gas = gas_u,
        .value = op == Opcode::DELEGATECALL ? state.env.value : value,
        .input_data = args_size_z
                          ? state.mstate.memory.read(
                                static_cast<size_t>(args_offset), args_size_z)
                          : byte_string_view{},
        .depth = state.env.depth + 1,
        .can_modify_state =
            op == Opcode::STATICCALL ? false : state.env.can_modify_state};

    status = Status::Success;
    return PendingCall{
        .params = params,
        .ret_offset = ret_size_z ? static_cast<size_t>(ret_offset) : 0,
        .ret_size = ret_size_z};
}

template <Revision rev, Opcode op>
    requires(is_create_opcode(op))
std::optional<PendingCall>
pre_create(StackPointer &sp, ExecutionState &state, Status &status)
{
    if (!state.env.can_modify_state) {
        status = Status::StaticModeViolation;
        return std::nullopt;
    }

    auto const value = sp.pop();
    auto const offset = sp.pop();
    auto const size = sp.pop();
    auto const salt = op == Opcode::CREATE2
                          ? sp.pop_bytes32()
                          : bytes32_t{};

    state.last_return_data.clear();

    status =
        state.mstate.memory.expand(state.mstate.gas_left, offset, size);
    if (status != Status::Success) {
        return std::nullopt;
    }

    auto const size_z = static_cast<size_t>(size);
    auto const words = round_up_bytes_to_words(size_z);

    // EIP-3860
    if constexpr (rev >= Revision::Shanghai) {
        if (size_z > max_initcode_size) {
            status = Status::OutOfGas;
            return std::nullopt;
        }
        status = charge(state, words * initcode_word_cost);
        if (status != Status::Success) {
            return std::nullopt;
        }
    }

    // EIP-1014: the init code is hashed to derive the address
    if constexpr (op == Opcode::CREATE2) {
        status = charge(state, words * keccak256_cost_per_word);
        if (status != Status::Success) {
            return std::nullopt;
        }
    }

    // EIP-150
    auto gas = state.mstate.gas_left;
    if constexpr (rev >= Revision::TangerineWhistle) {
        gas -= gas / 64;
    }

    status = Status::Success;
    return PendingCall{
        .params =
            CallParameters{
                .kind = op == Opcode::CREATE ? CallKind::Create
                                             : CallKind::Create2,
                .sender = state.env.address,
                .recipient = {},
                .code_address = {},
                .gas = gas,
                .value = value,
                .input_data = size_z ? state.mstate.memory.read(
                                           static_cast<size_t>(offset), size_z)
                                     : byte_string_view{},
                .depth = state.env.depth + 1,
                .can_modify_state = true,
                .salt = salt},
        .ret_offset = 0,
        .ret_size = 0};
}

// Places the output of a successful creation into the new account
template <Revision rev>
Status deposit_code(ExecutionState &state)
{
    STRATA_ASSERT(state.env.is_create);
    auto const &code = state.return_data;

    // EIP-3541
    if constexpr (rev >= Revision::London) {
        if (!code.empty() && code[0] == 0xef) {
            return Status::ContractValidationFailure;
        }
    }

    // EIP-170
    if constexpr (rev >= Revision::SpuriousDragon) {
        if (code.size() > max_code_size) {
            return Status::OutOfGas;
        }
    }

    auto const cost = code.size() * code_deposit_cost;
    if (state.mstate.gas_left < cost) {
        if constexpr (rev == Revision::Frontier) {
            // YP: no code is deposited, the creation still succeeds
            return Status::Success;
        }
        else {
            // EIP-2
            return Status::OutOfGas;
        }
    }
    state.mstate.gas_left -= cost;
    state.sstate.state().set_code(state.env.address, code);
    return Status::Success;
}

template <Status status>
Status halt(StackPointer sp, ExecutionState &state)
{
    auto const &offset = sp.pop();
    auto const &size = sp.pop();

    if (auto const grow_status = state.mstate.memory.expand(
            state.mstate.gas_left, offset, size);
        grow_status != Status::Success) {
        return grow_status;
    }

    if (size) {
        state.return_data = state.mstate.memory.read(
            static_cast<size_t>(offset), static_cast<size_t>(size));
    }
    return status;
}

template <Revision rev>
struct Trait<rev, Opcode::CREATE>
{
    static constexpr size_t stack_height_required = 3;
    static constexpr int stack_height_change = -2;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = create_cost;

    static std::optional<PendingCall>
    prepare(StackPointer &sp, ExecutionState &state, Status &status)
    {
        return pre_create<rev, Opcode::CREATE>(sp, state, status);
    }
};

template <Revision rev>
struct Trait<rev, Opcode::CALL>
{
    static constexpr size_t stack_height_required = 7;
    static constexpr int stack_height_change = -6;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = call_cost<rev>();

    static std::optional<PendingCall>
    prepare(StackPointer &sp, ExecutionState &state, Status &status)
    {
        return pre_call<rev, Opcode::CALL>(sp, state, status);
    }
};

template <Revision rev>
struct Trait<rev, Opcode::CALLCODE>
{
    static constexpr size_t stack_height_required = 7;
    static constexpr int stack_height_change = -6;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = call_cost<rev>();

    static std::optional<PendingCall>
    prepare(StackPointer &sp, ExecutionState &state, Status &status)
    {
        return pre_call<rev, Opcode::CALLCODE>(sp, state, status);
    }
};

template <Revision rev>
struct Trait<rev, Opcode::RETURN>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -2;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = zero_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        return halt<Status::Success>(sp, state);
    }
};

template <Revision rev>
struct Trait<rev, Opcode::DELEGATECALL>
{
    static constexpr size_t stack_height_required = 6;
    static constexpr int stack_height_change = -5;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Homestead;
    static constexpr uint64_t baseline_cost = call_cost<rev>();

    static std::optional<PendingCall>
    prepare(StackPointer &sp, ExecutionState &state, Status &status)
    {
        return pre_call<rev, Opcode::DELEGATECALL>(sp, state, status);
    }
};

template <Revision rev>
struct Trait<rev, Opcode::CREATE2>
{
    static constexpr size_t stack_height_required = 4;
    static constexpr int stack_height_change = -3;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Constantinople;
    static constexpr uint64_t baseline_cost = create_cost;

    static std::optional<PendingCall>
    prepare(StackPointer &sp, ExecutionState &state, Status &status)
    {
        return pre_create<rev, Opcode::CREATE2>(sp, state, status);
    }
};

template <Revision rev>
struct Trait<rev, Opcode::STATICCALL>
{
    static constexpr size_t stack_height_required = 6;
    static constexpr int stack_height_change = -5;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Byzantium;
    static constexpr uint64_t baseline_cost = call_cost<rev>();

    static std::optional<PendingCall>
    prepare(StackPointer &sp, ExecutionState &state, Status &status)
    {
        return pre_call<rev, Opcode::STATICCALL>(sp, state, status);
    }
};

// EIP-140
template <Revision rev>
struct Trait<rev, Opcode::REVERT>
{
    static constexpr size_t stack_height_required = 2;
    static constexpr int stack_height_change = -2;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = rev >= Revision::Byzantium;
    static constexpr uint64_t baseline_cost = zero_cost;

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        return halt<Status::Revert>(sp, state);
    }
};

template <Revision rev>
struct Trait<rev, Opcode::SELFDESTRUCT>
{
    static constexpr size_t stack_height_required = 1;
    static constexpr int stack_height_change = -1;
    static constexpr size_t pc_increment = 1;
    static constexpr bool exist = true;
    static constexpr uint64_t baseline_cost = selfdestruct_cost<rev>();

    static Status impl(StackPointer sp, ExecutionState &state)
    {
        if (!state.env.can_modify_state) {
            return Status::StaticModeViolation;
        }

        auto const beneficiary = sp.pop_address();
        auto &world = state.sstate.state();

        // EIP-2929
        if constexpr (rev >= Revision::Berlin) {
            if (!state.sstate.access_account(beneficiary)) {
                if (auto const status =
                        charge(state, cold_account_access_cost<rev>());
                    status != Status::Success) {
                    return status;
                }
            }
        }

        // EIP-150, EIP-161
        if constexpr (rev == Revision::TangerineWhistle) {
            if (!world.account_exists(beneficiary)) {
                if (auto const status = charge(state, new_account_cost);
                    status != Status::Success) {
                    return status;
                }
            }
        }
        else if constexpr (rev >= Revision::SpuriousDragon) {
            if (state.sstate.self_balance() != bytes32_t{} &&
                world.account_is_dead(beneficiary)) {
                if (auto const status = charge(state, new_account_cost);
                    status != Status::Success) {
                    return status;
                }
            }
        }

        auto const destructed =
            state.sstate.selfdestruct(beneficiary);

        // EIP-3529
        if constexpr (rev < Revision::London) {
            if (destructed) {
                state.gas_refund += selfdestruct_refund;
            }
        }
        return Status::Success;
    }
};

STRATA_EVM_NAMESPACE_END
