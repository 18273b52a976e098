#include <strata/core/account.hpp>
#include <strata/core/address.hpp>
#include <strata/core/assert.h>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/keccak.hpp>
#include <strata/core/likely.h>
#include <strata/core/receipt.hpp>
#include <strata/host/host_store.hpp>
#include <strata/state/account_state.hpp>
#include <strata/state/keys.hpp>
#include <strata/state/state.hpp>
#include <strata/state/state_diff.hpp>

#include <evmc/evmc.h>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

STRATA_ANONYMOUS_NAMESPACE_BEGIN

uint256_t load_word(byte_string_view const value)
{
    STRATA_ASSERT(value.size() == sizeof(bytes32_t));
    return intx::be::unsafe::load<uint256_t>(value.data());
}

byte_string store_word(uint256_t const &value)
{
    auto const bytes = intx::be::store<bytes32_t>(value);
    return byte_string{to_byte_string_view(bytes)};
}

uint32_t load_generation(byte_string_view const value)
{
    STRATA_ASSERT(value.size() == sizeof(uint32_t));
    uint32_t generation;
    std::memcpy(&generation, value.data(), sizeof(generation));
    return intx::to_big_endian(generation);
}

bool same_code(SharedCode const &a, SharedCode const &b)
{
    if (a == b) {
        return true;
    }
    byte_string_view const lhs = a ? byte_string_view{*a} : byte_string_view{};
    byte_string_view const rhs = b ? byte_string_view{*b} : byte_string_view{};
    return lhs == rhs;
}

STRATA_ANONYMOUS_NAMESPACE_END

STRATA_NAMESPACE_BEGIN

State::State(HostStore &store)
    : store_{store}
{
}

OriginalAccountState &State::original_account_state(Address const &address)
{
    auto it = original_.find(address);
    if (it != original_.end()) {
        return it->second;
    }

    auto const nonce = store_.read(address_to_key(KeyPrefix::Nonce, address));
    auto const balance =
        store_.read(address_to_key(KeyPrefix::Balance, address));
    auto code = store_.read(address_to_key(KeyPrefix::Code, address));
    auto const generation =
        store_.read(address_to_key(KeyPrefix::Generation, address));

    std::optional<Account> account;
    if (nonce.has_value() || balance.has_value() || code.has_value()) {
        account = Account{
            .balance = balance.has_value() ? load_word(*balance) : 0,
            .nonce = nonce.has_value()
                         ? static_cast<uint64_t>(load_word(*nonce))
                         : 0};
    }

    SharedCode shared_code;
    if (code.has_value() && !code->empty()) {
        shared_code = std::make_shared<byte_string const>(std::move(*code));
    }

    it = original_
             .try_emplace(
                 address,
                 std::move(account),
                 std::move(shared_code),
                 generation.has_value() ? load_generation(*generation) : 0u)
             .first;
    return it->second;
}

AccountState const &State::recent_account_state(Address const &address)
{
    auto const it = current_.find(address);
    if (it != current_.end()) {
        return it->second.recent();
    }
    return original_account_state(address);
}

AccountState &State::current_account_state(Address const &address)
{
    auto it = current_.find(address);
    if (STRATA_UNLIKELY(it == current_.end())) {
        auto const &original = original_account_state(address);
        it = current_
                 .try_emplace(
                     address,
                     AccountState{original.account_, original.code_},
                     version_)
                 .first;
    }
    return it->second.current(version_);
}

bytes32_t const &
State::original_storage(Address const &address, bytes32_t const &key)
{
    auto &original = original_account_state(address);
    auto it = original.storage_.find(key);
    if (it == original.storage_.end()) {
        bytes32_t value{};
        if (original.account_.has_value()) {
            auto const stored = store_.read(
                storage_to_key(address, key, original.generation_));
            if (stored.has_value()) {
                value = to_bytes(byte_string_view{*stored});
            }
        }
        it = original.storage_.try_emplace(key, value).first;
    }
    return it->second;
}

std::optional<byte_string> const &State::original_raw(byte_string_view const key)
{
    auto it = raw_original_.find(key);
    if (it == raw_original_.end()) {
        it = raw_original_.emplace(byte_string{key}, store_.read(key)).first;
    }
    return it->second;
}

////////////////////////////////////////
// Overlays
////////////////////////////////////////

void State::push()
{
    ++version_;
}

void State::pop_accept()
{
    STRATA_ASSERT(version_);

    for (auto &[_, stack] : current_) {
        stack.pop_accept(version_);
    }
    logs_.pop_accept(version_);
    for (auto &[_, stack] : raw_current_) {
        stack.pop_accept(version_);
    }

    --version_;
}

void State::pop_reject()
{
    STRATA_ASSERT(version_);

    std::vector<Address> removals;
    for (auto &[address, stack] : current_) {
        if (stack.pop_reject(version_)) {
            removals.push_back(address);
        }
    }
    for (auto const &address : removals) {
        current_.erase(address);
    }

    logs_.pop_reject(version_);

    for (auto it = raw_current_.begin(); it != raw_current_.end();) {
        if (it->second.pop_reject(version_)) {
            it = raw_current_.erase(it);
        }
        else {
            ++it;
        }
    }

    --version_;
}

OverlayHandle State::begin_overlay()
{
    push();
    return OverlayHandle{version_};
}

void State::commit(OverlayHandle const handle)
{
    STRATA_ASSERT(handle.version == version_);

    pop_accept();
    if (version_ == 0) {
        flush();
    }
}

void State::discard(OverlayHandle const handle)
{
    STRATA_ASSERT(handle.version == version_);

    pop_reject();
}

void State::flush()
{
    STRATA_ASSERT(version_ == 0);

    diff_ = StateDiff{};

    for (auto const &[address, stack] : current_) {
        auto const &recent = stack.recent();
        auto const &original = original_account_state(address);

        bool const destroyed = recent.is_destructed();
        bool const existed = !is_empty(original);
        bool const exists = !destroyed && !is_empty(recent);

        AccountDiff diff{.address = address, .destroyed = destroyed};

        uint32_t generation = original.generation_;
        if (destroyed) {
            ++generation;
            store_.write(
                address_to_key(KeyPrefix::Generation, address),
                to_big_endian_byte_string(generation));
        }

        uint64_t const old_nonce = existed ? original.account_->nonce : 0;
        uint64_t const new_nonce = exists ? recent.account_->nonce : 0;
        if (old_nonce != new_nonce) {
            auto const key = address_to_key(KeyPrefix::Nonce, address);
            if (new_nonce == 0) {
                store_.remove(key);
            }
            else {
                store_.write(key, store_word(new_nonce));
            }
            diff.nonce = new_nonce;
        }

        uint256_t const old_balance =
            existed ? original.account_->balance : uint256_t{0};
        uint256_t const new_balance =
            exists ? recent.account_->balance : uint256_t{0};
        if (old_balance != new_balance) {
            auto const key = address_to_key(KeyPrefix::Balance, address);
            if (new_balance == 0) {
                store_.remove(key);
            }
            else {
                store_.write(key, store_word(new_balance));
            }
            diff.balance = new_balance;
        }

        SharedCode const new_code = exists ? recent.code_ : SharedCode{};
        if (!same_code(original.code_, new_code)) {
            auto const key = address_to_key(KeyPrefix::Code, address);
            if (!new_code || new_code->empty()) {
                store_.remove(key);
                diff.code = byte_string{};
            }
            else {
                store_.write(key, *new_code);
                diff.code = *new_code;
            }
        }

        if (!destroyed) {
            for (auto const &[key, value] : recent.storage_) {
                auto const it = original.storage_.find(key);
                STRATA_ASSERT(it != original.storage_.end());
                if (it->second == value) {
                    continue;
                }
                auto const storage_key =
                    storage_to_key(address, key, generation);
                if (value == bytes32_t{}) {
                    store_.remove(storage_key);
                }
                else {
                    store_.write(storage_key, to_byte_string_view(value));
                }
                diff.storage.emplace_back(key, value);
            }
        }

        if (destroyed || diff.nonce.has_value() || diff.balance.has_value() ||
            diff.code.has_value() || !diff.storage.empty()) {
            diff_.accounts.push_back(std::move(diff));
        }
    }

    for (auto const &[key, stack] : raw_current_) {
        auto const &value = stack.recent();
        if (value == original_raw(key)) {
            continue;
        }
        if (value.has_value()) {
            store_.write(key, *value);
        }
        else {
            store_.remove(key);
        }
        ++diff_.raw_keys_written;
    }

    LOG_DEBUG(
        "flush: {} accounts, {} engine keys",
        diff_.accounts.size(),
        diff_.raw_keys_written);

    original_.clear();
    current_.clear();
    logs_ = VersionStack<std::vector<Log>>{{}};
    raw_original_.clear();
    raw_current_.clear();
}

////////////////////////////////////////
// Accounts
////////////////////////////////////////

bool State::account_exists(Address const &address)
{
    return recent_account_state(address).account_.has_value();
}

bool State::account_is_dead(Address const &address)
{
    return is_empty(recent_account_state(address));
}

void State::create_contract(Address const &address)
{
    auto &state = current_account_state(address);
    uint256_t const balance =
        state.account_.has_value() ? state.account_->balance : uint256_t{0};
    state.account_ = Account{.balance = balance, .nonce = 0};
    state.code_.reset();
    state.storage_.clear();
}

uint64_t State::get_nonce(Address const &address)
{
    auto const &account = recent_account_state(address).account_;
    if (STRATA_LIKELY(account.has_value())) {
        return account->nonce;
    }
    return 0;
}

void State::set_nonce(Address const &address, uint64_t const nonce)
{
    auto &account = current_account_state(address).account_;
    if (!account.has_value()) {
        account = Account{};
    }
    account->nonce = nonce;
}

bytes32_t State::get_balance(Address const &address)
{
    return intx::be::store<bytes32_t>(get_balance_u256(address));
}

uint256_t State::get_balance_u256(Address const &address)
{
    auto const &account = recent_account_state(address).account_;
    if (STRATA_LIKELY(account.has_value())) {
        return account->balance;
    }
    return 0;
}

void State::add_to_balance(Address const &address, uint256_t const &delta)
{
    auto &account = current_account_state(address).account_;
    if (!account.has_value()) {
        account = Account{};
    }
    STRATA_ASSERT(
        std::numeric_limits<uint256_t>::max() - delta >= account->balance);
    account->balance += delta;
}

void State::subtract_from_balance(
    Address const &address, uint256_t const &delta)
{
    auto &account = current_account_state(address).account_;
    if (!account.has_value()) {
        account = Account{};
    }
    STRATA_ASSERT(delta <= account->balance);
    account->balance -= delta;
}

SharedCode State::get_code(Address const &address)
{
    return recent_account_state(address).code_;
}

bytes32_t State::get_code_hash(Address const &address)
{
    auto const &state = recent_account_state(address);
    if (!state.account_.has_value()) {
        return bytes32_t{};
    }
    if (!state.code_ || state.code_->empty()) {
        return NULL_HASH;
    }
    return to_bytes(keccak256(byte_string_view{*state.code_}));
}

void State::set_code(Address const &address, byte_string_view const code)
{
    auto &state = current_account_state(address);
    if (!state.account_.has_value()) {
        state.account_ = Account{};
    }
    if (code.empty()) {
        state.code_.reset();
    }
    else {
        state.code_ = std::make_shared<byte_string const>(code);
    }
}

////////////////////////////////////////
// Storage
////////////////////////////////////////

bytes32_t State::get_storage(Address const &address, bytes32_t const &key)
{
    auto const it = current_.find(address);
    if (it != current_.end()) {
        auto const &storage = it->second.recent().storage_;
        auto const it2 = storage.find(key);
        if (it2 != storage.end()) {
            return it2->second;
        }
    }
    return original_storage(address, key);
}

evmc_storage_status State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    bytes32_t const original_value = original_storage(address, key);
    return current_account_state(address).set_storage(
        key, value, original_value);
}

////////////////////////////////////////
// Substate
////////////////////////////////////////

evmc_access_status State::access_account(Address const &address)
{
    return current_account_state(address).access();
}

evmc_access_status
State::access_storage(Address const &address, bytes32_t const &key)
{
    return current_account_state(address).access_storage(key);
}

void State::touch(Address const &address)
{
    current_account_state(address).touch();
}

bool State::selfdestruct(Address const &address, Address const &beneficiary)
{
    uint256_t const balance = get_balance_u256(address);
    add_to_balance(beneficiary, balance);
    touch(beneficiary);

    auto &state = current_account_state(address);
    STRATA_ASSERT(state.account_.has_value());
    state.account_->balance = 0;
    return state.destruct();
}

void State::destruct_suicides()
{
    for (auto &[_, stack] : current_) {
        if (!stack.recent().is_destructed()) {
            continue;
        }
        auto &state = stack.current(version_);
        state.account_.reset();
        state.code_.reset();
        state.storage_.clear();
    }
}

void State::destruct_touched_dead()
{
    for (auto &[_, stack] : current_) {
        auto const &recent = stack.recent();
        if (!recent.is_touched() || !recent.account_.has_value() ||
            !is_empty(recent)) {
            continue;
        }
        stack.current(version_).account_.reset();
    }
}

void State::store_log(Log const &log)
{
    logs_.current(version_).push_back(log);
}

std::vector<Log> const &State::logs() const
{
    return logs_.recent();
}

////////////////////////////////////////
// Engine keys
////////////////////////////////////////

std::optional<byte_string> State::read_raw(byte_string_view const key)
{
    auto const it = raw_current_.find(key);
    if (it != raw_current_.end()) {
        return it->second.recent();
    }
    return original_raw(key);
}

void State::write_raw(byte_string_view const key, byte_string_view const value)
{
    auto it = raw_current_.find(key);
    if (it == raw_current_.end()) {
        it = raw_current_
                 .emplace(
                     byte_string{key},
                     VersionStack<std::optional<byte_string>>{
                         original_raw(key), version_})
                 .first;
    }
    it->second.current(version_) = byte_string{value};
}

void State::remove_raw(byte_string_view const key)
{
    auto it = raw_current_.find(key);
    if (it == raw_current_.end()) {
        it = raw_current_
                 .emplace(
                     byte_string{key},
                     VersionStack<std::optional<byte_string>>{
                         original_raw(key), version_})
                 .first;
    }
    it->second.current(version_).reset();
}

STRATA_NAMESPACE_END
