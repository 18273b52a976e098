#pragma once

#include <strata/config.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/core/result.hpp>
#include <strata/evm/revision.hpp>

#include <cstdint>
#include <limits>
#include <string>

STRATA_NAMESPACE_BEGIN

class State;

// Persisted under the STATE config key
struct EngineState
{
    uint256_t chain_id{};
    std::string owner_id{};
    std::string bridge_provider_id{};
    uint64_t upgrade_delay_blocks{0};

    friend bool operator==(EngineState const &, EngineState const &) = default;
};

// Supplied by the host deployment, never persisted
struct EngineOptions
{
    evm::Revision revision{evm::Revision::Shanghai};
    uint64_t call_gas_limit{
        static_cast<uint64_t>(std::numeric_limits<int64_t>::max())};
    bool benchmark_mode{false};
};

// RLP [chain_id, owner_id, bridge_provider_id, upgrade_delay_blocks], also
// the argument layout of `new`
byte_string encode_engine_state(EngineState const &);
Result<EngineState> decode_engine_state(byte_string_view &);

// NotInitialized when no state was stored
Result<EngineState> load_engine_state(State &);
void save_engine_state(State &, EngineState const &);

STRATA_NAMESPACE_END
