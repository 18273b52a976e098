#include <strata/engine/engine_error.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/generic_code.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<strata::EngineError>::mapping> const &
quick_status_code_from_enum<strata::EngineError>::value_mappings()
{
    using strata::EngineError;

    static std::initializer_list<mapping> const v = {
        {EngineError::Success, "success", {errc::success}},
        {EngineError::NotInitialized, "engine not initialized", {}},
        {EngineError::AlreadyInitialized, "engine already initialized", {}},
        {EngineError::NotAllowed, "caller not allowed", {}},
        {EngineError::NotReady, "upgrade not ready", {}},
        {EngineError::NoPendingUpgrade, "no pending upgrade", {}},
        {EngineError::ArgumentParse, "argument parse error", {}},
        {EngineError::InvalidChainId, "invalid chain id", {}},
        {EngineError::InvalidSignature, "invalid signature", {}},
        {EngineError::IncorrectNonce, "incorrect nonce", {}},
        {EngineError::InsufficientBalance, "insufficient balance", {}},
        {EngineError::IntrinsicGas, "intrinsic gas exceeds limit", {}},
        {EngineError::BalanceOverflow, "balance overflow", {}},
        {EngineError::BenchmarkDisabled, "benchmark mode disabled", {}},
        {EngineError::UnknownMethod, "unknown method", {}},
        {EngineError::TokenAlreadyRegistered, "token already registered", {}},
        {EngineError::TokenNotFound, "token not found", {}},
        {EngineError::TokenDeployFailed, "token deployment failed", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
