#pragma once

#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/call_context.hpp>
#include <strata/evm/config.hpp>
#include <strata/state/account_state.hpp>

#include <cstddef>

STRATA_EVM_NAMESPACE_BEGIN

// 9.3
struct ExecutionEnvironment
{
    Address address; // I_a
    Address sender; // I_s
    uint256_t value; // I_v
    byte_string_view input_data; // I_d
    SharedCode code; // I_b
    size_t depth; // I_e
    bool can_modify_state; // I_w
    bool is_create;
    CallContext const &context; // I_o, I_p, I_H
};

STRATA_EVM_NAMESPACE_END
