#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/keccak.hpp>
#include <strata/execution/create_contract_address.hpp>
#include <strata/rlp/encode2.hpp>

#include <cstdint>
#include <cstring>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

// YP Sec 7: Eq 85 and 86
Address hash_and_clip(byte_string_view const b)
{
    auto const h = keccak256(b);
    Address result{};
    std::memcpy(result.bytes, &h.bytes[12], sizeof(Address));
    return result;
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

// YP Sec 7: Eq 87, top
Address create_contract_address(Address const &from, uint64_t const nonce)
{
    return hash_and_clip(rlp::encode_list2(
        rlp::encode_address(from), rlp::encode_unsigned(nonce)));
}

// EIP-1014
Address create2_contract_address(
    Address const &from, bytes32_t const &salt, hash256 const &code_hash)
{
    byte_string b{0xff};
    b += to_byte_string_view(from);
    b += to_byte_string_view(salt);
    b += byte_string_view{code_hash.bytes, sizeof(code_hash.bytes)};
    return hash_and_clip(b);
}

STRATA_NAMESPACE_END
