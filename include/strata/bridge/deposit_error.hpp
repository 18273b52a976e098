#pragma once

#include <strata/config.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

STRATA_NAMESPACE_BEGIN

enum class DepositError
{
    Success = 0,
    RlpFailed,
    SchemaMismatch,
    InvalidSender,
    InvalidAmount,
    InvalidFee,
    TooManyParts,
    InvalidAccount,
    InvalidEthAddress,
    FeeExceedsAmount,
};

STRATA_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<strata::DepositError>
    : quick_status_code_from_enum_defaults<strata::DepositError>
{
    static constexpr auto const domain_name = "Deposit Error";
    static constexpr auto const domain_uuid =
        "c41e8f07-2b9d-4a35-8e60-71f3d2a9b5c4";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
