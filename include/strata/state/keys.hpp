#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>

#include <cstdint>
#include <string_view>

STRATA_NAMESPACE_BEGIN

// First byte of every host key, bumped on incompatible layout changes
inline constexpr unsigned char storage_version = 0x07;

enum class KeyPrefix : unsigned char
{
    Config = 0x0,
    Nonce = 0x1,
    Balance = 0x2,
    Code = 0x3,
    Storage = 0x4,
    Generation = 0x5,
    Bridge = 0x6,
};

byte_string bytes_to_key(KeyPrefix, byte_string_view);

byte_string address_to_key(KeyPrefix, Address const &);

byte_string storage_to_key(
    Address const &, bytes32_t const &key, uint32_t generation);

// Config keys
inline constexpr std::string_view engine_state_key = "STATE";
inline constexpr std::string_view upgrade_code_key = "UPGRADE_CODE";
inline constexpr std::string_view upgrade_index_key = "UPGRADE_INDEX";
inline constexpr std::string_view engine_code_key = "ENGINE_CODE";
inline constexpr std::string_view bench_block_key = "BENCH_BLOCK";

byte_string config_key(std::string_view);

// Bridge keys
byte_string bridged_balance_key(std::string_view account_id);
byte_string bridged_supply_key();
byte_string erc20_token_key(std::string_view host_token);
byte_string host_token_key(Address const &token);

STRATA_NAMESPACE_END
