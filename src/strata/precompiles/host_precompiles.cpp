#include <strata/bridge/ledger.hpp>
#include <strata/config.hpp>
#include <strata/core/account_id.hpp>
#include <strata/core/address.hpp>
#include <strata/core/balance.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/fmt.hpp>
#include <strata/core/int.hpp>
#include <strata/core/keccak.hpp>
#include <strata/core/receipt.hpp>
#include <strata/core/wei.hpp>
#include <strata/evm/revision.hpp>
#include <strata/evm/status.hpp>
#include <strata/host/host_context.hpp>
#include <strata/precompiles/precompile_registry.hpp>
#include <strata/state/state.hpp>

#include <fmt/format.h>

#include <quill/Quill.h>

#include <intx/intx.hpp>

#include <cstdint>
#include <cstring>
#include <string_view>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint64_t exit_gas = 5000;
constexpr uint64_t account_id_gas = 15;

Address precompile_address(std::string_view const name)
{
    // same derivation as host accounts: last 20 bytes of keccak(name)
    return host_account_to_address(name);
}

bytes32_t address_topic(Address const &address)
{
    bytes32_t topic{};
    std::memcpy(
        topic.bytes + sizeof(bytes32_t) - sizeof(Address),
        address.bytes,
        sizeof(Address));
    return topic;
}

PrecompileOutput failure()
{
    return {.status = evm::Status::PrecompileFailure, .output = {}};
}

uint64_t exit_cost(byte_string_view, evm::Revision)
{
    return exit_gas;
}

uint64_t account_id_cost(byte_string_view, evm::Revision)
{
    return account_id_gas;
}

// Burns the attached value; the caller's share is checked by the dispatcher
// before the value reached this account
bool burn_value(PrecompileCall const &call, Address const &self)
{
    if (call.is_static || call.address != self || !call.value) {
        return false;
    }
    call.state.subtract_from_balance(self, call.value);
    return true;
}

PrecompileOutput exit_to_host(PrecompileCall const &call)
{
    auto const &self = exit_to_host_address();
    auto const account_id = to_string_view(call.input);
    auto const amount = Wei{call.value}.try_into_u128();
    if (!is_valid_account_id(account_id) || !amount.has_value()) {
        return failure();
    }
    if (!burn_value(call, self)) {
        return failure();
    }
    if (!credit_bridged_balance(call.state, account_id, Balance{*amount})
             .has_value()) {
        return failure();
    }

    static auto const signature =
        to_bytes(keccak256(std::string_view{"ExitToHost(address,uint256)"}));
    Log log{.address = self};
    log.topics = {signature, address_topic(call.caller)};
    log.data = byte_string{
        intx::be::store<bytes32_t>(call.value).bytes, sizeof(bytes32_t)};
    log.data += call.input;
    call.state.store_log(log);

    LOG_INFO(
        "exit to host account {}: {} wei",
        account_id,
        intx::to_string(call.value));
    return {.status = evm::Status::Success, .output = {}};
}

PrecompileOutput exit_to_ethereum(PrecompileCall const &call)
{
    auto const &self = exit_to_ethereum_address();
    if (call.input.size() != sizeof(Address)) {
        return failure();
    }
    if (!burn_value(call, self)) {
        return failure();
    }

    Address recipient;
    std::memcpy(recipient.bytes, call.input.data(), sizeof(Address));

    static auto const signature = to_bytes(keccak256(
        std::string_view{"ExitToEthereum(address,address,uint256)"}));
    Log log{.address = self};
    log.topics = {
        signature, address_topic(call.caller), address_topic(recipient)};
    log.data = byte_string{
        intx::be::store<bytes32_t>(call.value).bytes, sizeof(bytes32_t)};
    call.state.store_log(log);

    LOG_INFO(
        "exit to ethereum: {} wei to {}",
        intx::to_string(call.value),
        fmt::format("{}", recipient));
    return {.status = evm::Status::Success, .output = {}};
}

PrecompileOutput predecessor_account_id(PrecompileCall const &call)
{
    return {
        .status = evm::Status::Success,
        .output = byte_string{
            to_byte_string_view(call.host.predecessor_account_id)}};
}

PrecompileOutput current_account_id(PrecompileCall const &call)
{
    return {
        .status = evm::Status::Success,
        .output =
            byte_string{to_byte_string_view(call.host.current_account_id)}};
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

Address const &exit_to_host_address()
{
    static Address const address = precompile_address("exitToHost");
    return address;
}

Address const &exit_to_ethereum_address()
{
    static Address const address = precompile_address("exitToEthereum");
    return address;
}

Address const &predecessor_account_id_address()
{
    static Address const address = precompile_address("predecessorAccountId");
    return address;
}

Address const &current_account_id_address()
{
    static Address const address = precompile_address("currentAccountId");
    return address;
}

void register_host_precompiles(PrecompileRegistry &registry)
{
    using evm::Revision;

    registry.add(
        exit_to_host_address(),
        {.name = "exit_to_host",
         .since = Revision::Frontier,
         .gas = &exit_cost,
         .run = &exit_to_host});
    registry.add(
        exit_to_ethereum_address(),
        {.name = "exit_to_ethereum",
         .since = Revision::Frontier,
         .gas = &exit_cost,
         .run = &exit_to_ethereum});
    registry.add(
        predecessor_account_id_address(),
        {.name = "predecessor_account_id",
         .since = Revision::Frontier,
         .gas = &account_id_cost,
         .run = &predecessor_account_id});
    registry.add(
        current_account_id_address(),
        {.name = "current_account_id",
         .since = Revision::Frontier,
         .gas = &account_id_cost,
         .run = &current_account_id});
}

STRATA_NAMESPACE_END
