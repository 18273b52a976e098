#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/result.hpp>

STRATA_NAMESPACE_BEGIN

// Call signed with EIP-712 typed data and submitted by a relayer. The
// declared sender and domain fields must match the signer and the engine.
struct MetaCallArgs
{
    Address sender{};
    uint256_t chain_id{};
    Address verifying_contract{};
    uint256_t v{};
    uint256_t r{};
    uint256_t s{};
    uint256_t nonce{};
    uint256_t fee_amount{};
    Address fee_address{};
    Address contract{};
    uint256_t value{};
    byte_string input{};
};

// RLP [sender, chain_id, verifying_contract, v, r, s, nonce, fee_amount,
//      fee_address, contract, value, input]
byte_string encode_meta_call_args(MetaCallArgs const &);
Result<MetaCallArgs> decode_meta_call_args(byte_string_view &);

bytes32_t
meta_call_domain_separator(uint256_t const &chain_id, Address const &engine);

bytes32_t meta_call_struct_hash(MetaCallArgs const &);

// keccak(0x19 0x01 ++ domain separator ++ struct hash), over the domain the
// envelope declares
bytes32_t meta_call_message(MetaCallArgs const &);

// Authenticated sender. InvalidSignature when the declared domain is not
// (chain_id, engine), v is not 27 or 28, the signature does not recover, or
// it recovers to an address other than the declared sender.
Result<Address> verify_meta_call(
    uint256_t const &chain_id, Address const &engine, MetaCallArgs const &);

STRATA_NAMESPACE_END
