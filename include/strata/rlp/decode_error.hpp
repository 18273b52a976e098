#pragma once

#include <strata/rlp/config.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

STRATA_RLP_NAMESPACE_BEGIN

enum class DecodeError
{
    Success = 0,
    TypeUnexpected,
    Overflow,
    InputTooLong,
    InputTooShort,
    ArrayLengthUnexpected,
    LeadingZero,
};

STRATA_RLP_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<strata::rlp::DecodeError>
    : quick_status_code_from_enum_defaults<strata::rlp::DecodeError>
{
    static constexpr auto const domain_name = "Decode Error";
    static constexpr auto const domain_uuid =
        "8f3c2b0e-5a41-4d1e-9b7a-2c6e0f4d9a13";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
