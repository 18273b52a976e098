#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/balance.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/receipt.hpp>
#include <strata/core/result.hpp>

#include <string>
#include <string_view>
#include <variant>

STRATA_NAMESPACE_BEGIN

// Recipient message "account"
struct HostRecipient
{
    std::string account_id;
};

// Recipient message "relayer:0x<address>"
struct EthRecipient
{
    std::string relayer_id;
    Address address;
};

using DepositRecipient = std::variant<HostRecipient, EthRecipient>;

struct Deposit
{
    Address sender{};
    DepositRecipient recipient{};
    Balance amount{};
    Fee fee{};
};

// keccak("Deposited(address,string,uint256,uint256)")
bytes32_t deposited_event_signature();

Result<DepositRecipient> parse_deposit_recipient(std::string_view message);

// Deposited(address indexed sender, string recipient, uint256 amount,
// uint256 fee) with ABI encoded data
Result<Deposit> parse_deposited_event(Log const &);

// RLP log entry as submitted by the bridge provider
Result<Deposit> decode_deposit(byte_string_view);

STRATA_NAMESPACE_END
