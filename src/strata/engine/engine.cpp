#include <strata/bridge/deposit.hpp>
#include <strata/bridge/erc20.hpp>
#include <strata/bridge/ledger.hpp>
#include <strata/core/account_id.hpp>
#include <strata/core/address.hpp>
#include <strata/core/assert.h>
#include <strata/core/block.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/fmt.hpp>
#include <strata/core/int.hpp>
#include <strata/core/result.hpp>
#include <strata/core/transaction.hpp>
#include <strata/engine/args.hpp>
#include <strata/engine/engine.hpp>
#include <strata/engine/engine_error.hpp>
#include <strata/engine/engine_state.hpp>
#include <strata/engine/meta_call.hpp>
#include <strata/engine/upgrade.hpp>
#include <strata/evm/call_context.hpp>
#include <strata/evm/call_parameters.hpp>
#include <strata/evm/status.hpp>
#include <strata/execution/block_hash.hpp>
#include <strata/execution/execute_root.hpp>
#include <strata/execution/execution_outcome.hpp>
#include <strata/execution/transaction_gas.hpp>
#include <strata/host/host_store.hpp>
#include <strata/precompiles/precompile_registry.hpp>
#include <strata/rlp/transaction_rlp.hpp>
#include <strata/state/keys.hpp>
#include <strata/state/state.hpp>

#include <ankerl/unordered_dense.h>

#include <boost/outcome/try.hpp>

#include <fmt/format.h>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <silkpre/secp256k1n.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

// Full consumption of the argument bytes is part of a successful parse
template <class T>
Result<T>
parse_args(byte_string_view args, Result<T> (*decode)(byte_string_view &))
{
    auto result = decode(args);
    if (result.has_error() || !args.empty()) {
        return EngineError::ArgumentParse;
    }
    return std::move(result).value();
}

Result<Address> parse_address(byte_string_view const args)
{
    if (args.size() != sizeof(Address)) {
        return EngineError::ArgumentParse;
    }
    Address address;
    std::memcpy(address.bytes, args.data(), sizeof(Address));
    return address;
}

byte_string encode_word(uint256_t const &n)
{
    return byte_string{to_byte_string_view(intx::be::store<bytes32_t>(n))};
}

byte_string encode_amount(uint128_t const &n)
{
    byte_string result(sizeof(uint128_t), 0);
    intx::be::unsafe::store(result.data(), n);
    return result;
}

uint64_t saturating_add(uint64_t const a, uint64_t const b)
{
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        return std::numeric_limits<uint64_t>::max();
    }
    return a + b;
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

Engine::Engine(
    HostStore &store, HostContext host, EngineOptions const options)
    : store_{store}
    , host_{std::move(host)}
    , options_{options}
{
}

Address Engine::caller_address() const
{
    return host_account_to_address(host_.predecessor_account_id);
}

Address Engine::engine_address() const
{
    return host_account_to_address(host_.current_account_id);
}

Result<EngineState> Engine::require_owner(State &state) const
{
    BOOST_OUTCOME_TRY(auto engine_state, load_engine_state(state));
    if (host_.predecessor_account_id != engine_state.owner_id) {
        return EngineError::NotAllowed;
    }
    return engine_state;
}

Result<EngineState> Engine::require_benchmark(State &state) const
{
    if (!options_.benchmark_mode) {
        return EngineError::BenchmarkDisabled;
    }
    return require_owner(state);
}

BlockHeader Engine::block_header(State &state) const
{
    BlockHeader header{
        .prev_randao = {},
        .difficulty = 0,
        .beneficiary = {},
        .number = host_.block_index,
        .gas_limit = options_.call_gas_limit,
        .timestamp = host_.block_timestamp,
        .base_fee_per_gas = uint256_t{0}};

    if (options_.benchmark_mode) {
        auto const value = state.read_raw(config_key(bench_block_key));
        if (value.has_value()) {
            byte_string_view enc{*value};
            auto const block = decode_begin_block_args(enc);
            STRATA_ASSERT(block.has_value());
            header.prev_randao = block.value().hash;
            header.difficulty = block.value().difficulty;
            header.beneficiary = block.value().coinbase;
            header.number = block.value().number;
            header.gas_limit = block.value().gas_limit;
            header.timestamp = block.value().timestamp;
        }
    }
    return header;
}

ExecutionOutcome Engine::execute(
    State &state, EngineState const &engine_state,
    evm::CallParameters const &params, Address const &origin,
    uint256_t const &gas_price, uint64_t const intrinsic_gas)
{
    auto const header = block_header(state);
    DerivedBlockHash const block_hash{
        engine_state.chain_id, host_.current_account_id};
    evm::CallContext const context{
        .origin = origin,
        .gas_price = gas_price,
        .chain_id = engine_state.chain_id,
        .header = header,
        .block_hash = block_hash,
        .precompiles = default_registry(),
        .host = host_};

    return execute_root(
        options_.revision, context, state, params, intrinsic_gas);
}

byte_string Engine::run_root(
    State &state, OverlayHandle const root, EngineState const &engine_state,
    evm::CallParameters const &params, Address const &origin,
    uint256_t const &gas_price, uint64_t const intrinsic_gas,
    bool const persist)
{
    auto outcome =
        execute(state, engine_state, params, origin, gas_price, intrinsic_gas);
    if (persist) {
        state.commit(root);
        outcome.diff = state.diff();
    }
    else {
        state.discard(root);
    }
    return encode_outcome(outcome);
}

////////////////////////////////////////
// Admin
////////////////////////////////////////

Result<byte_string> Engine::init(byte_string_view const args)
{
    State state{store_};
    if (state.read_raw(config_key(engine_state_key)).has_value()) {
        return EngineError::AlreadyInitialized;
    }
    if (host_.predecessor_account_id != host_.current_account_id) {
        return EngineError::NotAllowed;
    }
    BOOST_OUTCOME_TRY(
        auto const engine_state, parse_args(args, decode_engine_state));

    auto const root = state.begin_overlay();
    save_engine_state(state, engine_state);
    state.commit(root);
    LOG_INFO(
        "initialized engine, owner {}, bridge provider {}",
        engine_state.owner_id,
        engine_state.bridge_provider_id);
    return byte_string{};
}

Result<byte_string> Engine::get_version()
{
    return byte_string{to_byte_string_view(STRATA_VERSION)};
}

Result<byte_string> Engine::get_owner()
{
    State state{store_};
    BOOST_OUTCOME_TRY(auto const engine_state, load_engine_state(state));
    return byte_string{to_byte_string_view(engine_state.owner_id)};
}

Result<byte_string> Engine::get_bridge_provider()
{
    State state{store_};
    BOOST_OUTCOME_TRY(auto const engine_state, load_engine_state(state));
    return byte_string{to_byte_string_view(engine_state.bridge_provider_id)};
}

Result<byte_string> Engine::get_chain_id()
{
    State state{store_};
    BOOST_OUTCOME_TRY(auto const engine_state, load_engine_state(state));
    return encode_word(engine_state.chain_id);
}

Result<byte_string> Engine::get_upgrade_index()
{
    State state{store_};
    return to_big_endian_byte_string(strata::get_upgrade_index(state));
}

Result<byte_string> Engine::stage_upgrade(byte_string_view const code)
{
    State state{store_};
    BOOST_OUTCOME_TRY(auto const engine_state, require_owner(state));

    auto const root = state.begin_overlay();
    strata::stage_upgrade(
        state,
        code,
        saturating_add(host_.block_index, engine_state.upgrade_delay_blocks));
    state.commit(root);
    return byte_string{};
}

Result<byte_string> Engine::deploy_upgrade()
{
    State state{store_};
    BOOST_OUTCOME_TRY(require_owner(state));

    auto const root = state.begin_overlay();
    auto res = strata::deploy_upgrade(state, host_.block_index);
    if (res.has_error()) {
        state.discard(root);
        return std::move(res).as_failure();
    }
    state.commit(root);
    return byte_string{};
}

////////////////////////////////////////
// Execution
////////////////////////////////////////

Result<byte_string> Engine::deploy_code(byte_string_view const code)
{
    State state{store_};
    BOOST_OUTCOME_TRY(auto const engine_state, load_engine_state(state));

    auto const sender = caller_address();
    evm::CallParameters const params{
        .kind = evm::CallKind::Create,
        .sender = sender,
        .recipient = {},
        .code_address = {},
        .gas = options_.call_gas_limit,
        .value = 0,
        .input_data = code,
        .depth = 0,
        .can_modify_state = true};

    auto const root = state.begin_overlay();
    return run_root(state, root, engine_state, params, sender, 0, 0, true);
}

Result<byte_string> Engine::call(byte_string_view const args)
{
    State state{store_};
    BOOST_OUTCOME_TRY(auto const engine_state, load_engine_state(state));
    BOOST_OUTCOME_TRY(auto const call_args, parse_args(args, decode_call_args));

    auto const sender = caller_address();
    evm::CallParameters const params{
        .kind = evm::CallKind::Call,
        .sender = sender,
        .recipient = call_args.contract,
        .code_address = call_args.contract,
        .gas = options_.call_gas_limit,
        .value = call_args.value,
        .input_data = call_args.input,
        .depth = 0,
        .can_modify_state = true};

    auto const root = state.begin_overlay();
    return run_root(state, root, engine_state, params, sender, 0, 0, true);
}

Result<byte_string> Engine::raw_call(byte_string_view const args)
{
    State state{store_};
    BOOST_OUTCOME_TRY(auto const engine_state, load_engine_state(state));
    BOOST_OUTCOME_TRY(
        auto const tx, parse_args(args, rlp::decode_transaction));

    if (tx.sc.chain_id.has_value() &&
        *tx.sc.chain_id != engine_state.chain_id) {
        return EngineError::InvalidChainId;
    }
    // EIP-2
    if (!silkpre::is_valid_signature(
            tx.sc.r,
            tx.sc.s,
            options_.revision >= evm::Revision::Homestead)) {
        return EngineError::InvalidSignature;
    }
    auto const sender = recover_sender(tx);
    if (!sender.has_value()) {
        return EngineError::InvalidSignature;
    }
    // EIP-2681
    if (tx.nonce != state.get_nonce(*sender) ||
        tx.nonce == std::numeric_limits<uint64_t>::max()) {
        return EngineError::IncorrectNonce;
    }
    auto const intrinsic = intrinsic_gas(options_.revision, tx);
    if (intrinsic > tx.gas_limit) {
        return EngineError::IntrinsicGas;
    }
    if (state.get_balance_u256(*sender) < tx.value) {
        return EngineError::InsufficientBalance;
    }

    auto const root = state.begin_overlay();
    // creations bump the sender nonce when the address is derived
    if (tx.to.has_value()) {
        state.set_nonce(*sender, tx.nonce + 1);
    }
    evm::CallParameters const params{
        .kind = tx.to.has_value() ? evm::CallKind::Call : evm::CallKind::Create,
        .sender = *sender,
        .recipient = tx.to.value_or(Address{}),
        .code_address = tx.to.value_or(Address{}),
        .gas = tx.gas_limit - intrinsic,
        .value = tx.value,
        .input_data = tx.data,
        .depth = 0,
        .can_modify_state = true};

    return run_root(
        state, root, engine_state, params, *sender, tx.gas_price, intrinsic,
        true);
}

Result<byte_string> Engine::meta_call(byte_string_view const args)
{
    State state{store_};
    BOOST_OUTCOME_TRY(auto const engine_state, load_engine_state(state));
    BOOST_OUTCOME_TRY(
        auto const meta_args, parse_args(args, decode_meta_call_args));
    BOOST_OUTCOME_TRY(
        auto const signer,
        verify_meta_call(engine_state.chain_id, engine_address(), meta_args));

    auto const nonce = state.get_nonce(signer);
    if (meta_args.nonce != nonce ||
        nonce == std::numeric_limits<uint64_t>::max()) {
        return EngineError::IncorrectNonce;
    }
    if (state.get_balance_u256(signer) < meta_args.fee_amount) {
        return EngineError::InsufficientBalance;
    }

    // the nonce and fee are applied outside the message overlay and survive
    // a failing inner call
    auto const root = state.begin_overlay();
    state.set_nonce(signer, nonce + 1);
    if (meta_args.fee_amount != 0) {
        auto const fee_recipient = meta_args.fee_address == Address{}
                                       ? caller_address()
                                       : meta_args.fee_address;
        state.subtract_from_balance(signer, meta_args.fee_amount);
        state.add_to_balance(fee_recipient, meta_args.fee_amount);
    }

    evm::CallParameters const params{
        .kind = evm::CallKind::Call,
        .sender = signer,
        .recipient = meta_args.contract,
        .code_address = meta_args.contract,
        .gas = options_.call_gas_limit,
        .value = meta_args.value,
        .input_data = meta_args.input,
        .depth = 0,
        .can_modify_state = true};

    return run_root(state, root, engine_state, params, signer, 0, 0, true);
}

Result<byte_string> Engine::view(byte_string_view const args)
{
    State state{store_};
    BOOST_OUTCOME_TRY(auto const engine_state, load_engine_state(state));
    BOOST_OUTCOME_TRY(auto const view_args, parse_args(args, decode_view_args));

    evm::CallParameters const params{
        .kind = evm::CallKind::Call,
        .sender = view_args.sender,
        .recipient = view_args.contract,
        .code_address = view_args.contract,
        .gas = options_.call_gas_limit,
        .value = view_args.value,
        .input_data = view_args.input,
        .depth = 0,
        .can_modify_state = false};

    auto const root = state.begin_overlay();
    return run_root(
        state, root, engine_state, params, view_args.sender, 0, 0, false);
}

////////////////////////////////////////
// Accounts
////////////////////////////////////////

Result<byte_string> Engine::get_code(byte_string_view const args)
{
    BOOST_OUTCOME_TRY(auto const address, parse_address(args));
    State state{store_};
    auto const code = state.get_code(address);
    return code ? *code : byte_string{};
}

Result<byte_string> Engine::get_balance(byte_string_view const args)
{
    BOOST_OUTCOME_TRY(auto const address, parse_address(args));
    State state{store_};
    return encode_word(state.get_balance_u256(address));
}

Result<byte_string> Engine::get_nonce(byte_string_view const args)
{
    BOOST_OUTCOME_TRY(auto const address, parse_address(args));
    State state{store_};
    return encode_word(state.get_nonce(address));
}

Result<byte_string> Engine::get_storage_at(byte_string_view const args)
{
    BOOST_OUTCOME_TRY(
        auto const storage_args,
        parse_args(args, decode_get_storage_at_args));
    State state{store_};
    return byte_string{to_byte_string_view(
        state.get_storage(storage_args.address, storage_args.key))};
}

////////////////////////////////////////
// Benchmarks
////////////////////////////////////////

Result<byte_string> Engine::begin_chain(byte_string_view const args)
{
    State state{store_};
    BOOST_OUTCOME_TRY(auto engine_state, require_benchmark(state));
    BOOST_OUTCOME_TRY(
        auto const chain_args, parse_args(args, decode_begin_chain_args));

    // the allocations must fit on top of the current balances
    ankerl::unordered_dense::map<Address, uint256_t> credited;
    for (auto const &[address, balance] : chain_args.genesis_alloc) {
        auto [it, inserted] = credited.try_emplace(address, 0);
        if (inserted) {
            it->second = state.get_balance_u256(address);
        }
        auto const sum = intx::addc(it->second, balance);
        if (sum.carry) {
            return EngineError::BalanceOverflow;
        }
        it->second = sum.value;
    }

    auto const root = state.begin_overlay();
    engine_state.chain_id = chain_args.chain_id;
    save_engine_state(state, engine_state);
    for (auto const &[address, balance] : chain_args.genesis_alloc) {
        state.add_to_balance(address, balance);
    }
    state.commit(root);
    LOG_INFO(
        "began benchmark chain with {} genesis accounts",
        chain_args.genesis_alloc.size());
    return byte_string{};
}

Result<byte_string> Engine::begin_block(byte_string_view const args)
{
    State state{store_};
    BOOST_OUTCOME_TRY(require_benchmark(state));
    BOOST_OUTCOME_TRY(
        auto const block_args, parse_args(args, decode_begin_block_args));

    auto const root = state.begin_overlay();
    state.write_raw(
        config_key(bench_block_key), encode_begin_block_args(block_args));
    state.commit(root);
    return byte_string{};
}

////////////////////////////////////////
// Bridge
////////////////////////////////////////

Result<byte_string> Engine::deposit(byte_string_view const args)
{
    State state{store_};
    BOOST_OUTCOME_TRY(auto const engine_state, load_engine_state(state));
    if (host_.predecessor_account_id != engine_state.bridge_provider_id) {
        return EngineError::NotAllowed;
    }
    BOOST_OUTCOME_TRY(auto const event, decode_deposit(args));

    auto const root = state.begin_overlay();
    if (auto const *const recipient =
            std::get_if<HostRecipient>(&event.recipient)) {
        if (!credit_bridged_balance(
                 state, recipient->account_id, event.amount)
                 .has_value()) {
            state.discard(root);
            return EngineError::BalanceOverflow;
        }
        LOG_INFO(
            "deposited {} to {}",
            intx::to_string(event.amount.into_u128()),
            recipient->account_id);
    }
    else {
        auto const &eth = std::get<EthRecipient>(event.recipient);
        auto const fee = event.fee.into_u128();
        auto const amount = event.amount.into_u128() - fee;
        state.add_to_balance(eth.address, uint256_t{amount});
        if (fee != 0) {
            state.add_to_balance(
                host_account_to_address(eth.relayer_id), uint256_t{fee});
        }
        LOG_INFO(
            "deposited {} wei to {} with fee {} for relayer {}",
            intx::to_string(amount),
            fmt::format("{}", eth.address),
            intx::to_string(fee),
            eth.relayer_id);
    }
    state.commit(root);
    return byte_string{};
}

Result<byte_string> Engine::get_bridged_balance(byte_string_view const args)
{
    auto const account_id = to_string_view(args);
    if (!is_valid_account_id(account_id)) {
        return EngineError::ArgumentParse;
    }
    State state{store_};
    return encode_amount(
        strata::get_bridged_balance(state, account_id).into_u128());
}

Result<byte_string> Engine::get_bridged_supply()
{
    State state{store_};
    return encode_amount(strata::get_bridged_supply(state).into_u128());
}

Result<byte_string> Engine::deploy_erc20_token(byte_string_view const args)
{
    auto const host_token = to_string_view(args);
    if (!is_valid_account_id(host_token)) {
        return EngineError::ArgumentParse;
    }
    State state{store_};
    BOOST_OUTCOME_TRY(auto const engine_state, load_engine_state(state));
    if (get_erc20_token(state, host_token).has_value()) {
        return EngineError::TokenAlreadyRegistered;
    }

    // the engine deploys and therefore administers the token
    auto const sender = engine_address();
    evm::CallParameters const params{
        .kind = evm::CallKind::Create,
        .sender = sender,
        .recipient = {},
        .code_address = {},
        .gas = options_.call_gas_limit,
        .value = 0,
        .input_data = erc20_init_code(),
        .depth = 0,
        .can_modify_state = true};

    auto const root = state.begin_overlay();
    auto const outcome = execute(state, engine_state, params, sender, 0, 0);
    if (outcome.status != evm::Status::Success || !outcome.created) {
        state.discard(root);
        LOG_WARNING(
            "erc20 deployment for {} failed: {}",
            std::string{host_token},
            evm::to_string(outcome.status));
        return EngineError::TokenDeployFailed;
    }
    register_erc20_token(state, host_token, *outcome.created);
    state.commit(root);
    LOG_INFO(
        "deployed erc20 {} for {}",
        fmt::format("{}", *outcome.created),
        std::string{host_token});
    return byte_string{to_byte_string_view(*outcome.created)};
}

Result<byte_string>
Engine::get_erc20_from_host_token(byte_string_view const args)
{
    auto const host_token = to_string_view(args);
    if (!is_valid_account_id(host_token)) {
        return EngineError::ArgumentParse;
    }
    State state{store_};
    auto const token = get_erc20_token(state, host_token);
    if (!token.has_value()) {
        return EngineError::TokenNotFound;
    }
    return byte_string{to_byte_string_view(*token)};
}

Result<byte_string>
Engine::get_host_token_from_erc20(byte_string_view const args)
{
    BOOST_OUTCOME_TRY(auto const token, parse_address(args));
    State state{store_};
    auto const host_token = get_host_token(state, token);
    if (!host_token.has_value()) {
        return EngineError::TokenNotFound;
    }
    return byte_string{to_byte_string_view(*host_token)};
}

////////////////////////////////////////
// Dispatch
////////////////////////////////////////

STRATA_NAMESPACE_END

STRATA_ANONYMOUS_NAMESPACE_BEGIN

using Handler = Result<byte_string> (*)(Engine &, byte_string_view);

struct Method
{
    std::string_view name;
    Handler handler;
};

constexpr std::array methods{
    Method{"new", [](Engine &e, byte_string_view a) { return e.init(a); }},
    Method{
        "get_version",
        [](Engine &e, byte_string_view) { return e.get_version(); }},
    Method{
        "get_owner", [](Engine &e, byte_string_view) { return e.get_owner(); }},
    Method{
        "get_bridge_provider",
        [](Engine &e, byte_string_view) { return e.get_bridge_provider(); }},
    Method{
        "get_chain_id",
        [](Engine &e, byte_string_view) { return e.get_chain_id(); }},
    Method{
        "get_upgrade_index",
        [](Engine &e, byte_string_view) { return e.get_upgrade_index(); }},
    Method{
        "stage_upgrade",
        [](Engine &e, byte_string_view a) { return e.stage_upgrade(a); }},
    Method{
        "deploy_upgrade",
        [](Engine &e, byte_string_view) { return e.deploy_upgrade(); }},
    Method{
        "deploy_code",
        [](Engine &e, byte_string_view a) { return e.deploy_code(a); }},
    Method{"call", [](Engine &e, byte_string_view a) { return e.call(a); }},
    Method{
        "raw_call", [](Engine &e, byte_string_view a) { return e.raw_call(a); }},
    Method{
        "meta_call",
        [](Engine &e, byte_string_view a) { return e.meta_call(a); }},
    Method{"view", [](Engine &e, byte_string_view a) { return e.view(a); }},
    Method{
        "get_code", [](Engine &e, byte_string_view a) { return e.get_code(a); }},
    Method{
        "get_balance",
        [](Engine &e, byte_string_view a) { return e.get_balance(a); }},
    Method{
        "get_nonce",
        [](Engine &e, byte_string_view a) { return e.get_nonce(a); }},
    Method{
        "get_storage_at",
        [](Engine &e, byte_string_view a) { return e.get_storage_at(a); }},
    Method{
        "begin_chain",
        [](Engine &e, byte_string_view a) { return e.begin_chain(a); }},
    Method{
        "begin_block",
        [](Engine &e, byte_string_view a) { return e.begin_block(a); }},
    Method{
        "deposit", [](Engine &e, byte_string_view a) { return e.deposit(a); }},
    Method{
        "get_bridged_balance",
        [](Engine &e, byte_string_view a) { return e.get_bridged_balance(a); }},
    Method{
        "get_bridged_supply",
        [](Engine &e, byte_string_view) { return e.get_bridged_supply(); }},
    Method{
        "deploy_erc20_token",
        [](Engine &e, byte_string_view a) { return e.deploy_erc20_token(a); }},
    Method{
        "get_erc20_from_host_token",
        [](Engine &e, byte_string_view a) {
            return e.get_erc20_from_host_token(a);
        }},
    Method{
        "get_host_token_from_erc20",
        [](Engine &e, byte_string_view a) {
            return e.get_host_token_from_erc20(a);
        }},
};

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

Result<byte_string>
Engine::dispatch(std::string_view const method, byte_string_view const args)
{
    for (auto const &entry : methods) {
        if (entry.name != method) {
            continue;
        }
        auto result = entry.handler(*this, args);
        if (result.has_error()) {
            LOG_WARNING(
                "{} rejected: {}",
                std::string{method},
                std::string{result.error().message().c_str()});
        }
        else {
            LOG_DEBUG(
                "{} returned {} bytes",
                std::string{method},
                result.value().size());
        }
        return result;
    }
    LOG_WARNING("unknown method {}", std::string{method});
    return EngineError::UnknownMethod;
}

STRATA_NAMESPACE_END
