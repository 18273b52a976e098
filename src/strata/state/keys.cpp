#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/state/keys.hpp>

#include <cstdint>
#include <string_view>
#include <utility>

STRATA_NAMESPACE_BEGIN

byte_string bytes_to_key(KeyPrefix const prefix, byte_string_view const bytes)
{
    byte_string key;
    key.reserve(2 + bytes.size());
    key.push_back(storage_version);
    key.push_back(std::to_underlying(prefix));
    key += bytes;
    return key;
}

byte_string address_to_key(KeyPrefix const prefix, Address const &address)
{
    return bytes_to_key(prefix, to_byte_string_view(address));
}

byte_string storage_to_key(
    Address const &address, bytes32_t const &key, uint32_t const generation)
{
    byte_string body;
    body.reserve(sizeof(Address) + sizeof(generation) + sizeof(bytes32_t));
    body += to_byte_string_view(address);
    body += to_big_endian_byte_string(generation);
    body += to_byte_string_view(key);
    return bytes_to_key(KeyPrefix::Storage, body);
}

byte_string config_key(std::string_view const name)
{
    return bytes_to_key(KeyPrefix::Config, to_byte_string_view(name));
}

byte_string bridged_balance_key(std::string_view const account_id)
{
    byte_string body{to_byte_string_view("BAL")};
    body += to_byte_string_view(account_id);
    return bytes_to_key(KeyPrefix::Bridge, body);
}

byte_string bridged_supply_key()
{
    return bytes_to_key(KeyPrefix::Bridge, to_byte_string_view("SUPPLY"));
}

byte_string erc20_token_key(std::string_view const host_token)
{
    byte_string body{to_byte_string_view("ERC20")};
    body += to_byte_string_view(host_token);
    return bytes_to_key(KeyPrefix::Bridge, body);
}

byte_string host_token_key(Address const &token)
{
    byte_string body{to_byte_string_view("TOKEN")};
    body += to_byte_string_view(token);
    return bytes_to_key(KeyPrefix::Bridge, body);
}

STRATA_NAMESPACE_END
