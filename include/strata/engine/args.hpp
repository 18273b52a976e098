#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/result.hpp>

#include <cstdint>
#include <utility>
#include <vector>

STRATA_NAMESPACE_BEGIN

// Argument layouts of the engine entry points, all RLP lists

// call: [contract, value, input]
struct CallArgs
{
    Address contract{};
    uint256_t value{};
    byte_string input{};
};

// view: [sender, contract, value, input]
struct ViewArgs
{
    Address sender{};
    Address contract{};
    uint256_t value{};
    byte_string input{};
};

// get_storage_at: [address, key]
struct GetStorageAtArgs
{
    Address address{};
    bytes32_t key{};
};

// begin_chain: [chain_id, [[address, balance]...]]
struct BeginChainArgs
{
    uint256_t chain_id{};
    std::vector<std::pair<Address, uint256_t>> genesis_alloc{};
};

// begin_block: [hash, coinbase, timestamp, number, difficulty, gas_limit]
struct BeginBlockArgs
{
    bytes32_t hash{};
    Address coinbase{};
    uint64_t timestamp{0};
    uint64_t number{0};
    uint256_t difficulty{};
    uint64_t gas_limit{0};
};

byte_string encode_call_args(CallArgs const &);
Result<CallArgs> decode_call_args(byte_string_view &);

byte_string encode_view_args(ViewArgs const &);
Result<ViewArgs> decode_view_args(byte_string_view &);

byte_string encode_get_storage_at_args(GetStorageAtArgs const &);
Result<GetStorageAtArgs> decode_get_storage_at_args(byte_string_view &);

byte_string encode_begin_chain_args(BeginChainArgs const &);
Result<BeginChainArgs> decode_begin_chain_args(byte_string_view &);

byte_string encode_begin_block_args(BeginBlockArgs const &);
Result<BeginBlockArgs> decode_begin_block_args(byte_string_view &);

STRATA_NAMESPACE_END
