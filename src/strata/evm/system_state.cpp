#include <strata/core/address.hpp>
#include <strata/core/assert.h>
#include <strata/core/bytes.hpp>
#include <strata/core/receipt.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/fee_schedule.hpp>
#include <strata/evm/system_state.hpp>
#include <strata/state/state.hpp>

#include <evmc/evmc.h>

#include <utility>

STRATA_EVM_NAMESPACE_BEGIN

SystemState::SystemState(Address const &self, State &state)
    : self_{self}
    , state_{state}
{
}

bool SystemState::access_account(Address const &address)
{
    return state_.access_account(address) == EVMC_ACCESS_WARM;
}

bool SystemState::access_storage(bytes32_t const &key)
{
    return state_.access_storage(self_, key) == EVMC_ACCESS_WARM;
}

bytes32_t SystemState::get_balance(Address const &address)
{
    return state_.get_balance(address);
}

bytes32_t SystemState::self_balance()
{
    return state_.get_balance(self_);
}

bytes32_t SystemState::get_storage(bytes32_t const &key)
{
    return state_.get_storage(self_, key);
}

StorageStatus
SystemState::set_storage(bytes32_t const &key, bytes32_t const &value)
{
    static_assert(EVMC_STORAGE_MODIFIED_RESTORED == 8);
    return static_cast<StorageStatus>(
        std::to_underlying(state_.set_storage(self_, key, value)));
}

bool SystemState::selfdestruct(Address const &beneficiary)
{
    return state_.selfdestruct(self_, beneficiary);
}

void SystemState::store_log(Log const &log)
{
    STRATA_ASSERT(log.address == self_);
    state_.store_log(log);
}

STRATA_EVM_NAMESPACE_END
