#pragma once

#include <strata/core/byte_string.hpp>
#include <strata/core/result.hpp>
#include <strata/core/transaction.hpp>
#include <strata/rlp/config.hpp>

STRATA_RLP_NAMESPACE_BEGIN

byte_string encode_transaction(Transaction const &);

// EIP-155: the chain id and two empty strings take the place of the
// signature when the transaction is replay protected
byte_string encode_transaction_for_signing(Transaction const &);

Result<Transaction> decode_transaction(byte_string_view &);

STRATA_RLP_NAMESPACE_END
