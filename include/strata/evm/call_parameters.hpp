#pragma once

#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/evm/config.hpp>

#include <cstddef>
#include <cstdint>

STRATA_EVM_NAMESPACE_BEGIN

enum class CallKind
{
    Call,
    CallCode,
    DelegateCall,
    StaticCall,
    Create,
    Create2,
};

constexpr bool is_create(CallKind const kind)
{
    return kind == CallKind::Create || kind == CallKind::Create2;
}

// YP Section 8; for creations input_data is the init code and recipient is
// filled in once the address is derived
struct CallParameters
{
    CallKind kind;
    Address sender; // s
    Address recipient; // r
    Address code_address; // c
    uint64_t gas; // g
    uint256_t value; // v
    byte_string_view input_data; // d
    size_t depth; // e
    bool can_modify_state; // w
    bytes32_t salt{}; // CREATE2 only
};

STRATA_EVM_NAMESPACE_END
