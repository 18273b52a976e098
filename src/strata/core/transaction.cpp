#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/keccak.hpp>
#include <strata/core/signature.hpp>
#include <strata/core/transaction.hpp>
#include <strata/rlp/transaction_rlp.hpp>

#include <optional>

STRATA_NAMESPACE_BEGIN

std::optional<Address> recover_sender(Transaction const &tx)
{
    byte_string const encoding = rlp::encode_transaction_for_signing(tx);
    return recover_address(to_bytes(keccak256(encoding)), tx.sc);
}

STRATA_NAMESPACE_END
