#pragma once

#include <strata/config.hpp>
#include <strata/core/balance.hpp>

#include <optional>
#include <string_view>

STRATA_NAMESPACE_BEGIN

class State;

// Bridged funds held by host accounts. Entries live under raw engine keys so
// they roll back with the overlay that wrote them.

Balance get_bridged_balance(State &, std::string_view account_id);

Balance get_bridged_supply(State &);

// Adds to the account balance and the total supply; nullopt on overflow, in
// which case nothing was written
std::optional<Balance>
credit_bridged_balance(State &, std::string_view account_id, Balance);

STRATA_NAMESPACE_END
