#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/int.hpp>
#include <strata/core/likely.h>
#include <strata/core/result.hpp>
#include <strata/core/transaction.hpp>
#include <strata/rlp/config.hpp>
#include <strata/rlp/decode.hpp>
#include <strata/rlp/decode_error.hpp>
#include <strata/rlp/encode2.hpp>
#include <strata/rlp/transaction_rlp.hpp>

#include <boost/outcome/try.hpp>

STRATA_RLP_NAMESPACE_BEGIN

namespace
{
    byte_string encode_to(std::optional<Address> const &to)
    {
        return to.has_value() ? encode_address(*to) : EMPTY_STRING;
    }

    byte_string encode_common(Transaction const &tx)
    {
        return encode_unsigned(tx.nonce) + encode_unsigned(tx.gas_price) +
               encode_unsigned(tx.gas_limit) + encode_to(tx.to) +
               encode_unsigned(tx.value) + encode_string2(tx.data);
    }
}

byte_string encode_transaction(Transaction const &tx)
{
    return encode_list_payload(
        encode_common(tx) + encode_unsigned(get_v(tx.sc)) +
        encode_unsigned(tx.sc.r) + encode_unsigned(tx.sc.s));
}

byte_string encode_transaction_for_signing(Transaction const &tx)
{
    auto payload = encode_common(tx);
    if (tx.sc.chain_id.has_value()) {
        payload += encode_unsigned(*tx.sc.chain_id);
        payload += EMPTY_STRING;
        payload += EMPTY_STRING;
    }
    return encode_list_payload(payload);
}

Result<Transaction> decode_transaction(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    Transaction tx;
    BOOST_OUTCOME_TRY(tx.nonce, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(tx.gas_price, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(tx.gas_limit, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(tx.to, decode_optional_address(payload));
    BOOST_OUTCOME_TRY(tx.value, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(auto const data, decode_string(payload));
    tx.data = data;
    BOOST_OUTCOME_TRY(auto const v, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(tx.sc.r, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(tx.sc.s, decode_unsigned<uint256_t>(payload));

    if (STRATA_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }
    if (STRATA_UNLIKELY(!tx.sc.from_v(v))) {
        return DecodeError::TypeUnexpected;
    }
    return tx;
}

STRATA_RLP_NAMESPACE_END
