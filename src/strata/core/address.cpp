#include <strata/core/address.hpp>
#include <strata/core/keccak.hpp>

#include <cstring>
#include <string_view>

STRATA_NAMESPACE_BEGIN

Address host_account_to_address(std::string_view const account_id)
{
    auto const hash = keccak256(account_id);
    Address result;
    std::memcpy(
        result.bytes,
        hash.bytes + sizeof(hash.bytes) - sizeof(result.bytes),
        sizeof(result.bytes));
    return result;
}

STRATA_NAMESPACE_END
