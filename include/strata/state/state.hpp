#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>
#include <strata/core/receipt.hpp>
#include <strata/state/account_state.hpp>
#include <strata/state/state_diff.hpp>
#include <strata/state/version_stack.hpp>

#include <evmc/evmc.h>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

STRATA_NAMESPACE_BEGIN

class HostStore;

// Identifies an open overlay; overlays close in LIFO order
struct OverlayHandle
{
    unsigned version;
};

// Transactional view of the host store. Every mutation is recorded in the
// innermost open overlay; committing the outermost overlay writes the result
// back to the host store in one pass.
class State
{
    template <class Key, class T>
    using Map = ankerl::unordered_dense::segmented_map<Key, T>;

    using RawMap = std::map<byte_string, std::optional<byte_string>, std::less<>>;
    using RawStackMap = std::map<
        byte_string, VersionStack<std::optional<byte_string>>, std::less<>>;

    HostStore &store_;

    Map<Address, OriginalAccountState> original_{};
    Map<Address, VersionStack<AccountState>> current_{};
    VersionStack<std::vector<Log>> logs_{{}};
    RawMap raw_original_{};
    RawStackMap raw_current_{};
    unsigned version_{0};

    StateDiff diff_{};

    OriginalAccountState &original_account_state(Address const &);
    AccountState const &recent_account_state(Address const &);
    AccountState &current_account_state(Address const &);
    bytes32_t const &original_storage(Address const &, bytes32_t const &key);
    std::optional<byte_string> const &original_raw(byte_string_view key);

    void push();
    void pop_accept();
    void pop_reject();
    void flush();

public:
    explicit State(HostStore &);

    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    ////////////////////////////////////////
    // Overlays
    ////////////////////////////////////////

    OverlayHandle begin_overlay();
    void commit(OverlayHandle);
    void discard(OverlayHandle);

    unsigned version() const
    {
        return version_;
    }

    // changes written by the most recent outermost commit
    StateDiff const &diff() const
    {
        return diff_;
    }

    ////////////////////////////////////////
    // Accounts
    ////////////////////////////////////////

    bool account_exists(Address const &);

    // EIP-161 empty or non-existent
    bool account_is_dead(Address const &);

    void create_contract(Address const &);

    uint64_t get_nonce(Address const &);
    void set_nonce(Address const &, uint64_t nonce);

    bytes32_t get_balance(Address const &);
    uint256_t get_balance_u256(Address const &);
    void add_to_balance(Address const &, uint256_t const &delta);
    void subtract_from_balance(Address const &, uint256_t const &delta);

    SharedCode get_code(Address const &);
    bytes32_t get_code_hash(Address const &);
    void set_code(Address const &, byte_string_view code);

    ////////////////////////////////////////
    // Storage
    ////////////////////////////////////////

    bytes32_t get_storage(Address const &, bytes32_t const &key);
    evmc_storage_status set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    ////////////////////////////////////////
    // Substate
    ////////////////////////////////////////

    evmc_access_status access_account(Address const &);
    evmc_access_status access_storage(Address const &, bytes32_t const &key);

    void touch(Address const &);

    // returns true the first time the account is scheduled for destruction
    bool selfdestruct(Address const &, Address const &beneficiary);

    void destruct_suicides();
    void destruct_touched_dead();

    void store_log(Log const &);
    std::vector<Log> const &logs() const;

    ////////////////////////////////////////
    // Engine keys
    ////////////////////////////////////////

    std::optional<byte_string> read_raw(byte_string_view key);
    void write_raw(byte_string_view key, byte_string_view value);
    void remove_raw(byte_string_view key);
};

STRATA_NAMESPACE_END
