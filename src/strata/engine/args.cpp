#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/likely.h>
#include <strata/core/result.hpp>
#include <strata/engine/args.hpp>
#include <strata/rlp/decode.hpp>
#include <strata/rlp/decode_error.hpp>
#include <strata/rlp/encode2.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <vector>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

Result<void> expect_end(byte_string_view const payload)
{
    if (STRATA_UNLIKELY(!payload.empty())) {
        return rlp::DecodeError::InputTooLong;
    }
    return outcome::success();
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

byte_string encode_call_args(CallArgs const &args)
{
    return rlp::encode_list2(
        rlp::encode_address(args.contract),
        rlp::encode_unsigned(args.value),
        rlp::encode_string2(args.input));
}

Result<CallArgs> decode_call_args(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, rlp::parse_list_metadata(enc));

    CallArgs args;
    BOOST_OUTCOME_TRY(args.contract, rlp::decode_address(payload));
    BOOST_OUTCOME_TRY(args.value, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(auto const input, rlp::decode_string(payload));
    args.input = input;
    BOOST_OUTCOME_TRY(expect_end(payload));
    return args;
}

byte_string encode_view_args(ViewArgs const &args)
{
    return rlp::encode_list2(
        rlp::encode_address(args.sender),
        rlp::encode_address(args.contract),
        rlp::encode_unsigned(args.value),
        rlp::encode_string2(args.input));
}

Result<ViewArgs> decode_view_args(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, rlp::parse_list_metadata(enc));

    ViewArgs args;
    BOOST_OUTCOME_TRY(args.sender, rlp::decode_address(payload));
    BOOST_OUTCOME_TRY(args.contract, rlp::decode_address(payload));
    BOOST_OUTCOME_TRY(args.value, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(auto const input, rlp::decode_string(payload));
    args.input = input;
    BOOST_OUTCOME_TRY(expect_end(payload));
    return args;
}

byte_string encode_get_storage_at_args(GetStorageAtArgs const &args)
{
    return rlp::encode_list2(
        rlp::encode_address(args.address), rlp::encode_bytes32(args.key));
}

Result<GetStorageAtArgs> decode_get_storage_at_args(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, rlp::parse_list_metadata(enc));

    GetStorageAtArgs args;
    BOOST_OUTCOME_TRY(args.address, rlp::decode_address(payload));
    BOOST_OUTCOME_TRY(args.key, rlp::decode_bytes32(payload));
    BOOST_OUTCOME_TRY(expect_end(payload));
    return args;
}

byte_string encode_begin_chain_args(BeginChainArgs const &args)
{
    std::vector<byte_string> alloc;
    alloc.reserve(args.genesis_alloc.size());
    for (auto const &[address, balance] : args.genesis_alloc) {
        alloc.push_back(rlp::encode_list2(
            rlp::encode_address(address), rlp::encode_unsigned(balance)));
    }
    return rlp::encode_list2(
        rlp::encode_unsigned(args.chain_id), rlp::encode_list2(alloc));
}

Result<BeginChainArgs> decode_begin_chain_args(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, rlp::parse_list_metadata(enc));

    BeginChainArgs args;
    BOOST_OUTCOME_TRY(
        args.chain_id, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(auto alloc_payload, rlp::parse_list_metadata(payload));
    while (!alloc_payload.empty()) {
        BOOST_OUTCOME_TRY(
            auto entry_payload, rlp::parse_list_metadata(alloc_payload));
        BOOST_OUTCOME_TRY(
            auto const address, rlp::decode_address(entry_payload));
        BOOST_OUTCOME_TRY(
            auto const balance,
            rlp::decode_unsigned<uint256_t>(entry_payload));
        BOOST_OUTCOME_TRY(expect_end(entry_payload));
        args.genesis_alloc.emplace_back(address, balance);
    }
    BOOST_OUTCOME_TRY(expect_end(payload));
    return args;
}

byte_string encode_begin_block_args(BeginBlockArgs const &args)
{
    return rlp::encode_list2(
        rlp::encode_bytes32(args.hash),
        rlp::encode_address(args.coinbase),
        rlp::encode_unsigned(args.timestamp),
        rlp::encode_unsigned(args.number),
        rlp::encode_unsigned(args.difficulty),
        rlp::encode_unsigned(args.gas_limit));
}

Result<BeginBlockArgs> decode_begin_block_args(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, rlp::parse_list_metadata(enc));

    BeginBlockArgs args;
    BOOST_OUTCOME_TRY(args.hash, rlp::decode_bytes32(payload));
    BOOST_OUTCOME_TRY(args.coinbase, rlp::decode_address(payload));
    BOOST_OUTCOME_TRY(args.timestamp, rlp::decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(args.number, rlp::decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(
        args.difficulty, rlp::decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(args.gas_limit, rlp::decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(expect_end(payload));
    return args;
}

STRATA_NAMESPACE_END
