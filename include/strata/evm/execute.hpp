#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/status.hpp>

#include <cstdint>

STRATA_NAMESPACE_BEGIN

class State;

STRATA_NAMESPACE_END

STRATA_EVM_NAMESPACE_BEGIN

struct CallContext;
struct CallParameters;

struct CallResult
{
    Status status;
    uint64_t gas_left;
    int64_t gas_refund;
    byte_string output; // return data, or revert data of a failed creation
    Address create_address; // set on successful creation
};

// Runs one message and every message it spawns. Nested messages are frames
// on an explicit stack; each message runs in its own overlay which is
// committed on success and discarded otherwise.
CallResult
execute(Revision, CallContext const &, State &, CallParameters const &);

STRATA_EVM_NAMESPACE_END
