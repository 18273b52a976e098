#pragma once

#include <strata/evm/config.hpp>

STRATA_EVM_NAMESPACE_BEGIN

enum class Status
{
    Success = 0,
    OutOfGas,
    InvalidMemoryAccess,
    StaticModeViolation,
    BadJumpDest,
    Revert,
    UndefinedInstruction,
    StackOverflow,
    StackUnderflow,
    PrecompileFailure,
    InsufficientBalance,
    CallDepthExceeded,
    ContractAddressCollision,
    ContractValidationFailure,
    NonceOverflow,
};

enum class StatusKind
{
    Success,
    Revert,
    Error,
};

constexpr StatusKind kind(Status const status)
{
    if (status == Status::Success) {
        return StatusKind::Success;
    }
    if (status == Status::Revert) {
        return StatusKind::Revert;
    }
    return StatusKind::Error;
}

char const *to_string(Status);

STRATA_EVM_NAMESPACE_END
