#pragma once

#include <strata/config.hpp>
#include <strata/core/account.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/state/account_substate.hpp>

#include <evmc/evmc.h>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

STRATA_NAMESPACE_BEGIN

using SharedCode = std::shared_ptr<byte_string const>;

class AccountState : public AccountSubstate
{
public:
    template <class Key, class T>
    using Map = ankerl::unordered_dense::segmented_map<Key, T>;

    std::optional<Account> account_{};
    SharedCode code_{};
    Map<bytes32_t, bytes32_t> storage_{};

    AccountState() = default;

    AccountState(std::optional<Account> account, SharedCode code)
        : account_{std::move(account)}
        , code_{std::move(code)}
    {
    }

    AccountState(AccountState &&) = default;
    AccountState(AccountState const &) = default;
    AccountState &operator=(AccountState &&) = default;
    AccountState &operator=(AccountState const &) = default;

    evmc_storage_status set_storage(
        bytes32_t const &key, bytes32_t const &value,
        bytes32_t const &original_value);

    byte_string_view code() const
    {
        return code_ ? byte_string_view{*code_} : byte_string_view{};
    }
};

// State as loaded from the host store at the start of the invocation
class OriginalAccountState final : public AccountState
{
public:
    uint32_t generation_{0};

    OriginalAccountState(
        std::optional<Account> account, SharedCode code, uint32_t generation)
        : AccountState{std::move(account), std::move(code)}
        , generation_{generation}
    {
    }
};

// EIP-161
inline bool is_empty(AccountState const &state)
{
    return !state.account_.has_value() ||
           (state.account_->nonce == 0 && state.account_->balance == 0 &&
            state.code().empty());
}

STRATA_NAMESPACE_END
