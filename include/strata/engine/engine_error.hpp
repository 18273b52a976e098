#pragma once

#include <strata/config.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

STRATA_NAMESPACE_BEGIN

// Rejections at the host boundary; nothing has been written when one of
// these is returned
enum class EngineError
{
    Success = 0,
    NotInitialized,
    AlreadyInitialized,
    NotAllowed,
    NotReady,
    NoPendingUpgrade,
    ArgumentParse,
    InvalidChainId,
    InvalidSignature,
    IncorrectNonce,
    InsufficientBalance,
    IntrinsicGas,
    BalanceOverflow,
    BenchmarkDisabled,
    UnknownMethod,
    TokenAlreadyRegistered,
    TokenNotFound,
    TokenDeployFailed,
};

STRATA_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<strata::EngineError>
    : quick_status_code_from_enum_defaults<strata::EngineError>
{
    static constexpr auto const domain_name = "Engine Error";
    static constexpr auto const domain_uuid =
        "3d7a51c2-90e4-4b6f-a1c8-5e27f09b4d6e";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
