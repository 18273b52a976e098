#include <strata/bridge/erc20.hpp>
#include <strata/core/address.hpp>
#include <strata/core/assert.h>
#include <strata/core/byte_string.hpp>
#include <strata/state/keys.hpp>
#include <strata/state/state.hpp>

#include <evmc/hex.hpp>

#include <cstring>
#include <optional>
#include <string>
#include <string_view>

STRATA_NAMESPACE_BEGIN

byte_string const &erc20_init_code()
{
    static byte_string const code = [] {
        auto const bytes = evmc::from_hex(
            // constructor: store the caller as admin, return the runtime
            "3374010000000000000000000000000000000000000000556101758061002560"
            "00396000f3"
            // reject value, dispatch on the selector
            "346100375760003560e01c806370a082311461003c57806318160ddd1461004f"
            "57806340c10f191461006f578063a9059cbb1461011e57"
            // revert
            "5b600080fd"
            // balanceOf(address)
            "5b60043560601b60601c5460005260206000f3"
            // totalSupply()
            "5b740100000000000000000000000000000000000000015460005260206000f3"
            // mint(address,uint256), admin only
            "5b33740100000000000000000000000000000000000000005414610091576000"
            "80fd"
            "5b60243560043560601b60601c74010000000000000000000000000000000000"
            "0000015482018074010000000000000000000000000000000000000001541161"
            "0037577401000000000000000000000000000000000000000155805482018155"
            "8160005260007fddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628"
            "f55a4df523b3ef60206000a300"
            // transfer(address,uint256)
            "5b602435335481811061003757819003335560043560601b60601c8054820181"
            "5581600052337fddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628"
            "f55a4df523b3ef60206000a350600160005260206000f3"
        );
        STRATA_ASSERT(bytes.has_value());
        return *bytes;
    }();
    return code;
}

std::optional<Address>
get_erc20_token(State &state, std::string_view const host_token)
{
    auto const value = state.read_raw(erc20_token_key(host_token));
    if (!value.has_value() || value->size() != sizeof(Address)) {
        return std::nullopt;
    }
    Address token;
    std::memcpy(token.bytes, value->data(), sizeof(Address));
    return token;
}

std::optional<std::string> get_host_token(State &state, Address const &token)
{
    auto const value = state.read_raw(host_token_key(token));
    if (!value.has_value()) {
        return std::nullopt;
    }
    return std::string{to_string_view(*value)};
}

void register_erc20_token(
    State &state, std::string_view const host_token, Address const &token)
{
    state.write_raw(erc20_token_key(host_token), to_byte_string_view(token));
    state.write_raw(host_token_key(token), to_byte_string_view(host_token));
}

STRATA_NAMESPACE_END
