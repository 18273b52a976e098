#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/receipt.hpp>
#include <strata/evm/config.hpp>

STRATA_NAMESPACE_BEGIN

class State;

STRATA_NAMESPACE_END

STRATA_EVM_NAMESPACE_BEGIN

enum class StorageStatus;

// YP 9. Storage, logs and self destruction only ever apply to the executing
// account, so those take no address. Everything else goes through state().
class SystemState
{
    Address self_;
    State &state_;

public:
    SystemState(Address const &self, State &);

    State &state()
    {
        return state_;
    }

    // true when the account or slot was already warm
    bool access_account(Address const &);
    bool access_storage(bytes32_t const &key);

    bytes32_t get_balance(Address const &);
    bytes32_t self_balance();

    bytes32_t get_storage(bytes32_t const &key);
    StorageStatus set_storage(bytes32_t const &key, bytes32_t const &value);

    // false when the account had already been destructed in this call
    bool selfdestruct(Address const &beneficiary);

    void store_log(Log const &);
};

STRATA_EVM_NAMESPACE_END
