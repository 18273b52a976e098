#include <strata/bridge/deposit_error.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/generic_code.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<strata::DepositError>::mapping> const &
quick_status_code_from_enum<strata::DepositError>::value_mappings()
{
    using strata::DepositError;

    static std::initializer_list<mapping> const v = {
        {DepositError::Success, "success", {errc::success}},
        {DepositError::RlpFailed, "log entry is not valid rlp", {}},
        {DepositError::SchemaMismatch, "not a deposit event", {}},
        {DepositError::InvalidSender, "invalid sender", {}},
        {DepositError::InvalidAmount, "invalid amount", {}},
        {DepositError::InvalidFee, "invalid fee", {}},
        {DepositError::TooManyParts, "too many recipient parts", {}},
        {DepositError::InvalidAccount, "invalid account id", {}},
        {DepositError::InvalidEthAddress, "invalid eth address", {}},
        {DepositError::FeeExceedsAmount, "fee exceeds amount", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
