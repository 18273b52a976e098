#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/keccak.hpp>
#include <strata/core/likely.h>
#include <strata/core/result.hpp>
#include <strata/core/signature.hpp>
#include <strata/engine/engine_error.hpp>
#include <strata/engine/meta_call.hpp>
#include <strata/rlp/decode.hpp>
#include <strata/rlp/decode_error.hpp>
#include <strata/rlp/encode2.hpp>

#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <string_view>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::string_view domain_name = "strata";
constexpr std::string_view domain_version = "1";

constexpr std::string_view domain_type =
    "EIP712Domain(string name,string version,uint256 chainId,address "
    "verifyingContract)";

constexpr std::string_view meta_call_type =
    "MetaCall(uint256 nonce,uint256 feeAmount,address feeAddress,address "
    "contractAddress,uint256 value,bytes input)";

// ABI words

void append_word(byte_string &out, uint256_t const &n)
{
    out += to_byte_string_view(intx::be::store<bytes32_t>(n));
}

void append_word(byte_string &out, Address const &a)
{
    out += byte_string(sizeof(bytes32_t) - sizeof(Address), 0);
    out += to_byte_string_view(a);
}

void append_word(byte_string &out, hash256 const &h)
{
    out += to_byte_string_view(to_bytes(h));
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

byte_string encode_meta_call_args(MetaCallArgs const &args)
{
    return rlp::encode_list2(
        rlp::encode_address(args.sender),
        rlp::encode_unsigned(args.chain_id),
        rlp::encode_address(args.verifying_contract),
        rlp::encode_unsigned(args.v),
        rlp::encode_unsigned(args.r),
        rlp::encode_unsigned(args.s),
        rlp::encode_unsigned(args.nonce),
        rlp::encode_unsigned(args.fee_amount),
        rlp::encode_address(args.fee_address),
        rlp::encode_address(args.contract),
        rlp::encode_unsigned(args.value),
        rlp::encode_string2(args.input));
}

Result<MetaCallArgs> decode_meta_call_args(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, rlp::parse_list_metadata(enc));

    MetaCallArgs args;
    BOOST_OUTCOME_TRY(args.sender, rlp::decode_address(payload));
    BOOST_OUTCOME_TRY(
        args.chain_id, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(args.verifying_contract, rlp::decode_address(payload));
    BOOST_OUTCOME_TRY(args.v, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(args.r, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(args.s, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(args.nonce, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(
        args.fee_amount, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(args.fee_address, rlp::decode_address(payload));
    BOOST_OUTCOME_TRY(args.contract, rlp::decode_address(payload));
    BOOST_OUTCOME_TRY(args.value, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(auto const input, rlp::decode_string(payload));
    args.input = input;

    if (STRATA_UNLIKELY(!payload.empty())) {
        return rlp::DecodeError::InputTooLong;
    }
    return args;
}

bytes32_t meta_call_domain_separator(
    uint256_t const &chain_id, Address const &engine)
{
    byte_string data;
    append_word(data, keccak256(domain_type));
    append_word(data, keccak256(domain_name));
    append_word(data, keccak256(domain_version));
    append_word(data, chain_id);
    append_word(data, engine);
    return to_bytes(keccak256(data));
}

bytes32_t meta_call_struct_hash(MetaCallArgs const &args)
{
    byte_string data;
    append_word(data, keccak256(meta_call_type));
    append_word(data, args.nonce);
    append_word(data, args.fee_amount);
    append_word(data, args.fee_address);
    append_word(data, args.contract);
    append_word(data, args.value);
    append_word(data, keccak256(args.input));
    return to_bytes(keccak256(data));
}

bytes32_t meta_call_message(MetaCallArgs const &args)
{
    byte_string data{0x19, 0x01};
    data += to_byte_string_view(
        meta_call_domain_separator(args.chain_id, args.verifying_contract));
    data += to_byte_string_view(meta_call_struct_hash(args));
    return to_bytes(keccak256(data));
}

Result<Address> verify_meta_call(
    uint256_t const &chain_id, Address const &engine, MetaCallArgs const &args)
{
    if (args.chain_id != chain_id || args.verifying_contract != engine) {
        return EngineError::InvalidSignature;
    }
    SignatureAndChain sc{.r = args.r, .s = args.s};
    if (!sc.from_v(args.v) || sc.chain_id.has_value()) {
        return EngineError::InvalidSignature;
    }
    auto const signer = recover_address(meta_call_message(args), sc);
    if (!signer.has_value() || *signer != args.sender) {
        return EngineError::InvalidSignature;
    }
    return *signer;
}

STRATA_NAMESPACE_END
