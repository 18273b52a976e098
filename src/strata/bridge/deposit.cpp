#include <strata/bridge/deposit.hpp>
#include <strata/bridge/deposit_error.hpp>
#include <strata/core/account_id.hpp>
#include <strata/core/address.hpp>
#include <strata/core/balance.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/keccak.hpp>
#include <strata/core/likely.h>
#include <strata/core/receipt.hpp>
#include <strata/core/result.hpp>
#include <strata/core/wei.hpp>
#include <strata/rlp/log_rlp.hpp>

#include <boost/outcome/try.hpp>

#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

constexpr size_t word_size = sizeof(bytes32_t);
constexpr std::string_view hex_prefix = "0x";

uint256_t load_word(byte_string_view const data, size_t const offset)
{
    return intx::be::unsafe::load<uint256_t>(data.data() + offset);
}

// the word at offset must fit a size_t and address bytes inside data
bool load_offset(
    byte_string_view const data, size_t const offset, size_t &result)
{
    auto const word = load_word(data, offset);
    if (word > data.size()) {
        return false;
    }
    result = static_cast<size_t>(word);
    return true;
}

Result<std::string_view> decode_abi_string(
    byte_string_view const data, size_t const head_offset)
{
    size_t offset;
    if (!load_offset(data, head_offset, offset) ||
        data.size() - offset < word_size) {
        return DepositError::SchemaMismatch;
    }
    size_t length;
    if (!load_offset(data, offset, length) ||
        data.size() - offset - word_size < length) {
        return DepositError::SchemaMismatch;
    }
    return to_string_view(data.substr(offset + word_size, length));
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

bytes32_t deposited_event_signature()
{
    static bytes32_t const signature = to_bytes(
        keccak256(std::string_view{"Deposited(address,string,uint256,uint256)"}));
    return signature;
}

Result<DepositRecipient> parse_deposit_recipient(std::string_view const message)
{
    auto const separator = message.find(':');
    if (separator == std::string_view::npos) {
        if (!is_valid_account_id(message)) {
            return DepositError::InvalidAccount;
        }
        return DepositRecipient{HostRecipient{std::string{message}}};
    }

    auto const relayer = message.substr(0, separator);
    auto const address = message.substr(separator + 1);
    if (address.find(':') != std::string_view::npos) {
        return DepositError::TooManyParts;
    }
    if (!is_valid_account_id(relayer)) {
        return DepositError::InvalidAccount;
    }
    // 40 hex digits, optionally prefixed with 0x
    auto digits = address;
    if (digits.size() == hex_prefix.size() + 2 * sizeof(Address)) {
        if (!digits.starts_with(hex_prefix)) {
            return DepositError::InvalidEthAddress;
        }
        digits.remove_prefix(hex_prefix.size());
    }
    if (digits.size() != 2 * sizeof(Address)) {
        return DepositError::InvalidEthAddress;
    }
    auto const bytes = evmc::from_hex(digits);
    if (!bytes.has_value() || bytes->size() != sizeof(Address)) {
        return DepositError::InvalidEthAddress;
    }

    EthRecipient recipient{.relayer_id = std::string{relayer}, .address = {}};
    std::memcpy(recipient.address.bytes, bytes->data(), sizeof(Address));
    return DepositRecipient{std::move(recipient)};
}

Result<Deposit> parse_deposited_event(Log const &log)
{
    if (log.topics.size() != 2 ||
        log.topics[0] != deposited_event_signature() ||
        log.data.size() < 3 * word_size) {
        return DepositError::SchemaMismatch;
    }

    Deposit deposit;

    auto const &sender = log.topics[1];
    if (!std::all_of(
            sender.bytes,
            sender.bytes + word_size - sizeof(Address),
            [](unsigned char const b) { return b == 0; })) {
        return DepositError::InvalidSender;
    }
    std::memcpy(
        deposit.sender.bytes,
        sender.bytes + word_size - sizeof(Address),
        sizeof(Address));

    byte_string_view const data{log.data};
    BOOST_OUTCOME_TRY(auto const message, decode_abi_string(data, 0));

    auto const amount = Wei{load_word(data, word_size)}.try_into_u128();
    if (!amount.has_value()) {
        return DepositError::InvalidAmount;
    }
    auto const fee = Wei{load_word(data, 2 * word_size)}.try_into_u128();
    if (!fee.has_value()) {
        return DepositError::InvalidFee;
    }
    if (*fee > *amount) {
        return DepositError::FeeExceedsAmount;
    }
    deposit.amount = Balance{*amount};
    deposit.fee = Fee{*fee};

    BOOST_OUTCOME_TRY(deposit.recipient, parse_deposit_recipient(message));
    return deposit;
}

Result<Deposit> decode_deposit(byte_string_view enc)
{
    auto const log = rlp::decode_log(enc);
    if (log.has_error() || !enc.empty()) {
        return DepositError::RlpFailed;
    }
    return parse_deposited_event(log.value());
}

STRATA_NAMESPACE_END
