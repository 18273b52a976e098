#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

STRATA_NAMESPACE_BEGIN

class State;

// Host tokens are mirrored by an ERC-20 contract the engine deploys. The
// deployer is the token admin and the only sender allowed to mint.
//
// Storage layout:
//   holder address   balance
//   2^160            admin
//   2^160 + 1        total supply

inline constexpr uint32_t erc20_balance_of_selector = 0x70a08231;
inline constexpr uint32_t erc20_total_supply_selector = 0x18160ddd;
inline constexpr uint32_t erc20_mint_selector = 0x40c10f19;
inline constexpr uint32_t erc20_transfer_selector = 0xa9059cbb;

byte_string const &erc20_init_code();

std::optional<Address> get_erc20_token(State &, std::string_view host_token);

std::optional<std::string> get_host_token(State &, Address const &token);

// Records the mapping in both directions
void register_erc20_token(
    State &, std::string_view host_token, Address const &token);

STRATA_NAMESPACE_END
