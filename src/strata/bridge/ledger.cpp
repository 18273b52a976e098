#include <strata/bridge/ledger.hpp>
#include <strata/core/balance.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/state/keys.hpp>
#include <strata/state/state.hpp>

#include <intx/intx.hpp>

#include <optional>
#include <string_view>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

Balance read_balance(State &state, byte_string_view const key)
{
    auto const value = state.read_raw(key);
    if (!value.has_value() || value->size() != sizeof(uint128_t)) {
        return Balance{};
    }
    return Balance{intx::be::unsafe::load<uint128_t>(value->data())};
}

void write_balance(State &state, byte_string_view const key, Balance const b)
{
    byte_string value(sizeof(uint128_t), 0);
    intx::be::unsafe::store(value.data(), b.into_u128());
    state.write_raw(key, value);
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

Balance get_bridged_balance(State &state, std::string_view const account_id)
{
    return read_balance(state, bridged_balance_key(account_id));
}

Balance get_bridged_supply(State &state)
{
    return read_balance(state, bridged_supply_key());
}

std::optional<Balance> credit_bridged_balance(
    State &state, std::string_view const account_id, Balance const amount)
{
    auto const balance_key = bridged_balance_key(account_id);
    auto const supply_key = bridged_supply_key();

    auto const balance = read_balance(state, balance_key).checked_add(amount);
    auto const supply = read_balance(state, supply_key).checked_add(amount);
    if (!balance.has_value() || !supply.has_value()) {
        return std::nullopt;
    }

    write_balance(state, balance_key, *balance);
    write_balance(state, supply_key, *supply);
    return balance;
}

STRATA_NAMESPACE_END
