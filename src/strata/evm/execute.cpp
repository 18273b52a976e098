#include <strata/core/address.hpp>
#include <strata/core/assert.h>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/keccak.hpp>
#include <strata/core/likely.h>
#include <strata/evm/arithmetic.hpp>
#include <strata/evm/bitwise.hpp>
#include <strata/evm/block_info.hpp>
#include <strata/evm/call_context.hpp>
#include <strata/evm/call_parameters.hpp>
#include <strata/evm/comparison.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/dup_swap.hpp>
#include <strata/evm/environmental.hpp>
#include <strata/evm/execute.hpp>
#include <strata/evm/execution_state.hpp>
#include <strata/evm/logging.hpp>
#include <strata/evm/opcodes.hpp>
#include <strata/evm/push.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/sha3.hpp>
#include <strata/evm/stack_memory_storage_flow.hpp>
#include <strata/evm/stack_pointer.hpp>
#include <strata/evm/status.hpp>
#include <strata/evm/system.hpp>
#include <strata/execution/create_contract_address.hpp>
#include <strata/precompiles/precompile_registry.hpp>
#include <strata/state/state.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <optional>
#include <utility>

STRATA_EVM_NAMESPACE_BEGIN

namespace
{
    struct Frame
    {
        int sp;
        uint64_t gas;
        size_t ret_offset;
        size_t ret_size;
        OverlayHandle overlay;
        std::shared_ptr<ExecutionState> state;
    };

    using Frames = std::deque<Frame>;

    struct Machine
    {
        CallContext const &context;
        State &state;
        Frames frames;
        std::optional<CallResult> result;
    };

    void transfer(
        State &state, Address const &from, Address const &to,
        uint256_t const &value)
    {
        if (value) {
            state.subtract_from_balance(from, value);
            state.add_to_balance(to, value);
        }
    }

    CallResult immediate_result(Status const status, uint64_t const gas)
    {
        return CallResult{
            .status = status,
            .gas_left = gas,
            .gas_refund = 0,
            .output = {},
            .create_address = {}};
    }

    void push_frame(
        Machine &m, CallParameters const &params, size_t const ret_offset,
        size_t const ret_size, OverlayHandle const overlay, SharedCode code)
    {
        m.frames.emplace_back(
            -1,
            params.gas,
            ret_offset,
            ret_size,
            overlay,
            std::make_shared<ExecutionState>(
                m.state, m.context, params, std::move(code)));
    }

    template <Revision rev>
    std::optional<CallResult> start_create(
        Machine &m, CallParameters params, size_t const ret_offset,
        size_t const ret_size)
    {
        auto &state = m.state;

        auto const nonce = state.get_nonce(params.sender);
        if (nonce == std::numeric_limits<uint64_t>::max()) {
            return immediate_result(Status::NonceOverflow, params.gas);
        }
        state.set_nonce(params.sender, nonce + 1);

        params.recipient =
            params.kind == CallKind::Create
                ? create_contract_address(params.sender, nonce)
                : create2_contract_address(
                      params.sender,
                      params.salt,
                      keccak256(params.input_data));
        params.code_address = params.recipient;

        if constexpr (rev >= Revision::Berlin) {
            state.access_account(params.recipient);
        }

        // EIP-684
        if (state.get_nonce(params.recipient) != 0 ||
            (state.get_code_hash(params.recipient) != NULL_HASH &&
             state.get_code_hash(params.recipient) != bytes32_t{})) {
            return CallResult{
                .status = Status::ContractAddressCollision,
                .gas_left = 0,
                .gas_refund = 0,
                .output = {},
                .create_address = {}};
        }

        auto const overlay = state.begin_overlay();
        state.create_contract(params.recipient);

        // EIP-161
        if constexpr (rev >= Revision::SpuriousDragon) {
            state.set_nonce(params.recipient, 1);
        }
        transfer(state, params.sender, params.recipient, params.value);

        if (params.input_data.empty()) {
            state.commit(overlay);
            return CallResult{
                .status = Status::Success,
                .gas_left = params.gas,
                .gas_refund = 0,
                .output = {},
                .create_address = params.recipient};
        }

        push_frame(
            m,
            params,
            ret_offset,
            ret_size,
            overlay,
            std::make_shared<byte_string const>(params.input_data));
        return std::nullopt;
    }

    template <Revision rev>
    std::optional<CallResult> start_call(
        Machine &m, CallParameters const &params, size_t const ret_offset,
        size_t const ret_size)
    {
        auto &state = m.state;

        auto const overlay = state.begin_overlay();
        if (params.kind != CallKind::DelegateCall) {
            transfer(state, params.sender, params.recipient, params.value);
        }
        // EIP-161: a zero value call still touches the recipient
        state.touch(params.recipient);

        if (auto const *const entry =
                m.context.precompiles.find(params.code_address, rev);
            entry) {
            auto const cost = entry->gas(params.input_data, rev);
            if (STRATA_UNLIKELY(cost > params.gas)) {
                state.discard(overlay);
                return CallResult{
                    .status = Status::OutOfGas,
                    .gas_left = 0,
                    .gas_refund = 0,
                    .output = {},
                    .create_address = {}};
            }
            auto output = entry->run(PrecompileCall{
                .rev = rev,
                .input = params.input_data,
                .caller = params.sender,
                .address = params.recipient,
                .value = params.value,
                .is_static = !params.can_modify_state,
                .state = state,
                .host = m.context.host});
            if (STRATA_UNLIKELY(output.status != Status::Success)) {
                state.discard(overlay);
                return CallResult{
                    .status = output.status,
                    .gas_left = 0,
                    .gas_refund = 0,
                    .output = {},
                    .create_address = {}};
            }
            state.commit(overlay);
            return CallResult{
                .status = Status::Success,
                .gas_left = params.gas - cost,
                .gas_refund = 0,
                .output = std::move(output.output),
                .create_address = {}};
        }

        auto code = state.get_code(params.code_address);
        if (!code || code->empty()) {
            state.commit(overlay);
            return immediate_result(Status::Success, params.gas);
        }

        push_frame(m, params, ret_offset, ret_size, overlay, std::move(code));
        return std::nullopt;
    }

    // Either resolves the message at once or pushes a frame for it
    template <Revision rev>
    std::optional<CallResult> start_message(
        Machine &m, CallParameters const &params, size_t const ret_offset,
        size_t const ret_size)
    {
        // light failures keep the forwarded gas
        if (params.depth > stack_limit) {
            return immediate_result(Status::CallDepthExceeded, params.gas);
        }
        if (params.kind != CallKind::DelegateCall && params.value &&
            m.state.get_balance_u256(params.sender) < params.value) {
            return immediate_result(Status::InsufficientBalance, params.gas);
        }

        if (is_create(params.kind)) {
            return start_create<rev>(m, params, ret_offset, ret_size);
        }
        return start_call<rev>(m, params, ret_offset, ret_size);
    }

    template <Revision rev>
    CallResult finish_frame(State &state, Frame &frame, Status status)
    {
        auto &substate = *frame.state;

        if (substate.env.is_create && status == Status::Success) {
            status = deposit_code<rev>(substate);
        }

        CallResult result{
            .status = status,
            .gas_left = substate.mstate.gas_left,
            .gas_refund = substate.gas_refund,
            .output = {},
            .create_address = {}};

        if (status != Status::Success && status != Status::Revert) {
            result.gas_left = 0;
        }
        if (status != Status::Success) {
            result.gas_refund = 0;
        }

        if (status == Status::Success) {
            state.commit(frame.overlay);
        }
        else {
            state.discard(frame.overlay);
        }

        if (substate.env.is_create) {
            if (status == Status::Success) {
                result.create_address = substate.env.address;
            }
            else if (status == Status::Revert) {
                result.output = std::move(substate.return_data);
            }
        }
        else if (status == Status::Success || status == Status::Revert) {
            result.output = std::move(substate.return_data);
        }
        return result;
    }

    // Hands a finished message back to the frame that issued it, or records
    // it as the final result when the root frame finished
    void return_to_caller(
        Machine &m, CallResult result, uint64_t const gas,
        size_t const ret_offset, size_t const ret_size, bool const create)
    {
        if (m.frames.empty()) {
            m.result = std::move(result);
            return;
        }

        STRATA_ASSERT(result.gas_left <= gas);
        auto &parent = m.frames.back();
        auto &state = *parent.state;
        auto sp = StackPointer{state.mstate.stack + parent.sp};

        bool const success = result.status == Status::Success;
        if (create) {
            sp.push_address(success ? result.create_address : Address{});
        }
        else {
            sp.push(success ? 1 : 0);
            if (auto const copy_size = std::min(ret_size, result.output.size());
                copy_size > 0) {
                state.mstate.memory.write(
                    ret_offset, copy_size, result.output);
            }
        }
        parent.sp += 1;

        state.mstate.gas_left -= gas - result.gas_left;
        if (success) {
            state.gas_refund += result.gas_refund;
        }
        state.last_return_data = std::move(result.output);
    }

    template <Revision rev>
    void end_frame(Machine &m, Status const status)
    {
        STRATA_ASSERT(!m.frames.empty());
        auto frame = std::move(m.frames.back());
        m.frames.pop_back();
        auto result = finish_frame<rev>(m.state, frame, status);
        return_to_caller(
            m,
            std::move(result),
            frame.gas,
            frame.ret_offset,
            frame.ret_size,
            frame.state->env.is_create);
    }

    template <Revision rev, Opcode op>
    Status validate_stack(int const sp)
    {
        using T = Trait<rev, op>;

        STRATA_DEBUG_ASSERT(sp >= -1 && sp < static_cast<int>(stack_limit));

        if constexpr (T::stack_height_change > 0) {
            static_assert(T::stack_height_change == 1);
            if (STRATA_UNLIKELY(sp + 1 == static_cast<int>(stack_limit))) {
                return Status::StackOverflow;
            }
        }

        if constexpr (T::stack_height_required > 0) {
            if (STRATA_UNLIKELY(
                    static_cast<size_t>(sp + 1) < T::stack_height_required)) {
                return Status::StackUnderflow;
            }
        }

        return Status::Success;
    }

    template <Revision rev, Opcode op>
    void execute_opcode(Machine &m)
    {
        using T = Trait<rev, op>;

        auto &frame = m.frames.back();
        auto &state = *frame.state;

        if constexpr (!T::exist) {
            end_frame<rev>(m, Status::UndefinedInstruction);
        }
        else {
            if (auto const status = validate_stack<rev, op>(frame.sp);
                status != Status::Success) {
                end_frame<rev>(m, status);
                return;
            }
            if (STRATA_UNLIKELY(state.mstate.gas_left < T::baseline_cost)) {
                end_frame<rev>(m, Status::OutOfGas);
                return;
            }
            state.mstate.gas_left -= T::baseline_cost;

            auto sptr = StackPointer{state.mstate.stack + frame.sp};

            if constexpr (is_call_opcode(op) || is_create_opcode(op)) {
                auto status = Status::Success;
                auto const pending = T::prepare(sptr, state, status);
                if (!pending.has_value()) {
                    STRATA_ASSERT(status != Status::Success);
                    end_frame<rev>(m, status);
                    return;
                }
                frame.sp -= static_cast<int>(T::stack_height_required);
                state.mstate.pc += T::pc_increment;

                auto const &[params, ret_offset, ret_size] = pending.value();
                if (auto result =
                        start_message<rev>(m, params, ret_offset, ret_size);
                    result.has_value()) {
                    return_to_caller(
                        m,
                        std::move(result).value(),
                        params.gas,
                        ret_offset,
                        ret_size,
                        is_create(params.kind));
                }
            }
            else {
                auto const status = T::impl(sptr, state);
                if (status != Status::Success) {
                    end_frame<rev>(m, status);
                    return;
                }
                if constexpr (
                    op == Opcode::STOP || op == Opcode::RETURN ||
                    op == Opcode::SELFDESTRUCT) {
                    end_frame<rev>(m, Status::Success);
                    return;
                }
                frame.sp += T::stack_height_change;
                state.mstate.pc += T::pc_increment;
            }
        }
    }

    using Instruction = void (*)(Machine &);
    using InstructionTable = std::array<Instruction, 256>;

    template <Revision rev, size_t... I>
    constexpr InstructionTable make_table(std::index_sequence<I...>)
    {
        return {&execute_opcode<rev, static_cast<Opcode>(I)>...};
    }

    template <Revision rev>
    constexpr InstructionTable instruction_table =
        make_table<rev>(std::make_index_sequence<256>{});
}

template <Revision rev>
CallResult execute(
    CallContext const &context, State &state, CallParameters const &params)
{
    Machine m{
        .context = context, .state = state, .frames = {}, .result = {}};

    if (auto result = start_message<rev>(m, params, 0, 0); result.has_value()) {
        return std::move(result).value();
    }

    while (!m.frames.empty()) {
        auto const &top = *m.frames.back().state;
        auto const op = top.analysis.code()[top.mstate.pc];
        instruction_table<rev>[op](m);
    }

    STRATA_ASSERT(m.result.has_value());
    return std::move(m.result).value();
}

CallResult execute(
    Revision const rev, CallContext const &context, State &state,
    CallParameters const &params)
{
    switch (rev) {
    case Revision::Frontier:
        return execute<Revision::Frontier>(context, state, params);
    case Revision::Homestead:
        return execute<Revision::Homestead>(context, state, params);
    case Revision::TangerineWhistle:
        return execute<Revision::TangerineWhistle>(context, state, params);
    case Revision::SpuriousDragon:
        return execute<Revision::SpuriousDragon>(context, state, params);
    case Revision::Byzantium:
        return execute<Revision::Byzantium>(context, state, params);
    case Revision::Constantinople:
        return execute<Revision::Constantinople>(context, state, params);
    case Revision::Petersburg:
        return execute<Revision::Petersburg>(context, state, params);
    case Revision::Istanbul:
        return execute<Revision::Istanbul>(context, state, params);
    case Revision::Berlin:
        return execute<Revision::Berlin>(context, state, params);
    case Revision::London:
        return execute<Revision::London>(context, state, params);
    case Revision::Paris:
        return execute<Revision::Paris>(context, state, params);
    case Revision::Shanghai:
        return execute<Revision::Shanghai>(context, state, params);
    }
    STRATA_ABORT("unknown revision");
}

STRATA_EVM_NAMESPACE_END
