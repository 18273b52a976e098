#include <strata/core/assert.h>
#include <strata/evm/config.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/status.hpp>

#include <optional>
#include <string_view>
#include <utility>

STRATA_EVM_NAMESPACE_BEGIN

char const *to_string(Status const status)
{
    switch (status) {
    case Status::Success:
        return "success";
    case Status::OutOfGas:
        return "out of gas";
    case Status::InvalidMemoryAccess:
        return "invalid memory access";
    case Status::StaticModeViolation:
        return "static mode violation";
    case Status::BadJumpDest:
        return "bad jump destination";
    case Status::Revert:
        return "revert";
    case Status::UndefinedInstruction:
        return "undefined instruction";
    case Status::StackOverflow:
        return "stack overflow";
    case Status::StackUnderflow:
        return "stack underflow";
    case Status::PrecompileFailure:
        return "precompile failure";
    case Status::InsufficientBalance:
        return "insufficient balance";
    case Status::CallDepthExceeded:
        return "call depth exceeded";
    case Status::ContractAddressCollision:
        return "contract address collision";
    case Status::ContractValidationFailure:
        return "contract validation failure";
    case Status::NonceOverflow:
        return "nonce overflow";
    }
    STRATA_ABORT("unknown status");
}

namespace
{
    constexpr std::pair<Revision, std::string_view> revision_names[] = {
        {Revision::Frontier, "frontier"},
        {Revision::Homestead, "homestead"},
        {Revision::TangerineWhistle, "tangerine_whistle"},
        {Revision::SpuriousDragon, "spurious_dragon"},
        {Revision::Byzantium, "byzantium"},
        {Revision::Constantinople, "constantinople"},
        {Revision::Petersburg, "petersburg"},
        {Revision::Istanbul, "istanbul"},
        {Revision::Berlin, "berlin"},
        {Revision::London, "london"},
        {Revision::Paris, "paris"},
        {Revision::Shanghai, "shanghai"},
    };
}

std::optional<Revision> revision_from_string(std::string_view const name)
{
    for (auto const &[rev, rev_name] : revision_names) {
        if (rev_name == name) {
            return rev;
        }
    }
    return std::nullopt;
}

char const *to_string(Revision const rev)
{
    for (auto const &[r, name] : revision_names) {
        if (r == rev) {
            return name.data();
        }
    }
    STRATA_ABORT("unknown revision");
}

STRATA_EVM_NAMESPACE_END
