#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/keccak.hpp>
#include <strata/execution/block_hash.hpp>

#include <intx/intx.hpp>

#include <string>
#include <utility>

STRATA_NAMESPACE_BEGIN

bytes32_t compute_block_hash(
    uint256_t const &chain_id, std::string_view const account_id,
    uint64_t const number)
{
    byte_string data;
    data.reserve(1 + sizeof(bytes32_t) + account_id.size() + sizeof(number));
    data.push_back(0x00);
    data += to_byte_string_view(intx::be::store<bytes32_t>(chain_id));
    data += to_byte_string_view(account_id);
    data += to_big_endian_byte_string(number);
    return to_bytes(keccak256(data));
}

DerivedBlockHash::DerivedBlockHash(
    uint256_t const &chain_id, std::string account_id)
    : chain_id_{chain_id}
    , account_id_{std::move(account_id)}
{
}

bytes32_t DerivedBlockHash::get(uint64_t const n) const
{
    return compute_block_hash(chain_id_, account_id_, n);
}

STRATA_NAMESPACE_END
