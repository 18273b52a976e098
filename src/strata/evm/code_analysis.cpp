#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/core/likely.h>
#include <strata/evm/code_analysis.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/opcodes.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>

STRATA_EVM_NAMESPACE_BEGIN

CodeAnalysis::CodeAnalysis(byte_string_view const code)
    : jump_dests_(code.size(), false)
{
    constexpr size_t max_immediate = 32;

    code_.reserve(code.size() + max_immediate + 1);
    code_.append(code);
    code_.append(max_immediate + 1, std::to_underlying(Opcode::STOP));

    constexpr auto push1 = std::to_underlying(Opcode::PUSH1);
    constexpr auto push32 = std::to_underlying(Opcode::PUSH32);
    size_t pc = 0;
    while (pc < code.size()) {
        auto const op = code[pc];
        if (op >= push1 && op <= push32) {
            pc += static_cast<size_t>(op - push1) + 2;
        }
        else {
            if (STRATA_UNLIKELY(op == std::to_underlying(Opcode::JUMPDEST))) {
                jump_dests_[pc] = true;
            }
            ++pc;
        }
    }
}

bool CodeAnalysis::is_jump_dest(uint256_t const &pc) const noexcept
{
    return pc < jump_dests_.size() && jump_dests_[static_cast<size_t>(pc)];
}

STRATA_EVM_NAMESPACE_END
