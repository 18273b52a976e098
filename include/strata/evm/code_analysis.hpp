#pragma once

#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/config.hpp>

#include <cstdint>
#include <vector>

STRATA_EVM_NAMESPACE_BEGIN

// A frame's code with its JUMPDEST map. The code is followed by enough zero
// bytes that a PUSH32 immediate and the STOP after the last instruction can
// be read without a bounds check.
class CodeAnalysis
{
    byte_string code_;
    std::vector<bool> jump_dests_;

public:
    explicit CodeAnalysis(byte_string_view code);

    byte_string const &code() const noexcept
    {
        return code_;
    }

    // JUMPDEST bytes inside PUSH immediates are not destinations
    bool is_jump_dest(uint256_t const &pc) const noexcept;
};

STRATA_EVM_NAMESPACE_END
