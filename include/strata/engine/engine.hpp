#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/block.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/core/result.hpp>
#include <strata/engine/engine_state.hpp>
#include <strata/evm/call_parameters.hpp>
#include <strata/execution/execution_outcome.hpp>
#include <strata/host/host_context.hpp>

#include <cstdint>
#include <string_view>

STRATA_NAMESPACE_BEGIN

class HostStore;
class State;
struct OverlayHandle;

// Host-facing entry points. Each invocation reads the host store through a
// fresh State and writes it back at most once, when the root overlay
// commits. Boundary errors are returned before anything is written.
class Engine
{
    HostStore &store_;
    HostContext host_;
    EngineOptions options_;

    Address caller_address() const;
    Address engine_address() const;

    Result<EngineState> require_owner(State &) const;
    Result<EngineState> require_benchmark(State &) const;

    BlockHeader block_header(State &) const;

    ExecutionOutcome execute(
        State &, EngineState const &, evm::CallParameters const &,
        Address const &origin, uint256_t const &gas_price,
        uint64_t intrinsic_gas);

    // runs one root message and commits it unless persist is false
    byte_string run_root(
        State &, OverlayHandle, EngineState const &,
        evm::CallParameters const &, Address const &origin,
        uint256_t const &gas_price, uint64_t intrinsic_gas, bool persist);

public:
    Engine(HostStore &, HostContext, EngineOptions = {});

    // admin
    Result<byte_string> init(byte_string_view args);
    Result<byte_string> get_version();
    Result<byte_string> get_owner();
    Result<byte_string> get_bridge_provider();
    Result<byte_string> get_chain_id();
    Result<byte_string> get_upgrade_index();
    Result<byte_string> stage_upgrade(byte_string_view code);
    Result<byte_string> deploy_upgrade();

    // execution
    Result<byte_string> deploy_code(byte_string_view code);
    Result<byte_string> call(byte_string_view args);
    Result<byte_string> raw_call(byte_string_view args);
    Result<byte_string> meta_call(byte_string_view args);
    Result<byte_string> view(byte_string_view args);

    // accounts
    Result<byte_string> get_code(byte_string_view args);
    Result<byte_string> get_balance(byte_string_view args);
    Result<byte_string> get_nonce(byte_string_view args);
    Result<byte_string> get_storage_at(byte_string_view args);

    // benchmarks
    Result<byte_string> begin_chain(byte_string_view args);
    Result<byte_string> begin_block(byte_string_view args);

    // bridge
    Result<byte_string> deposit(byte_string_view args);
    Result<byte_string> get_bridged_balance(byte_string_view args);
    Result<byte_string> get_bridged_supply();
    Result<byte_string> deploy_erc20_token(byte_string_view args);
    Result<byte_string> get_erc20_from_host_token(byte_string_view args);
    Result<byte_string> get_host_token_from_erc20(byte_string_view args);

    // routes a host method name to its entry point
    Result<byte_string> dispatch(std::string_view method, byte_string_view args);
};

STRATA_NAMESPACE_END
