#include <strata/core/bytes.hpp>
#include <strata/state/account_state.hpp>

#include <evmc/evmc.h>

STRATA_NAMESPACE_BEGIN

// EIP-2200 classification of original, current and new values
evmc_storage_status AccountState::set_storage(
    bytes32_t const &key, bytes32_t const &value,
    bytes32_t const &original_value)
{
    bytes32_t current_value = original_value;
    if (auto const it = storage_.find(key); it != storage_.end()) {
        current_value = it->second;
    }

    auto const status = [&] {
        if (current_value == value) {
            return EVMC_STORAGE_ASSIGNED;
        }
        if (value == bytes32_t{}) {
            if (original_value == current_value) {
                return EVMC_STORAGE_DELETED;
            }
            else if (original_value == bytes32_t{}) {
                return EVMC_STORAGE_ADDED_DELETED;
            }
            return EVMC_STORAGE_MODIFIED_DELETED;
        }
        if (current_value == bytes32_t{}) {
            if (original_value == bytes32_t{}) {
                return EVMC_STORAGE_ADDED;
            }
            else if (value == original_value) {
                return EVMC_STORAGE_DELETED_RESTORED;
            }
            return EVMC_STORAGE_DELETED_ADDED;
        }
        else if (original_value == current_value) {
            return EVMC_STORAGE_MODIFIED;
        }
        else if (original_value == value) {
            return EVMC_STORAGE_MODIFIED_RESTORED;
        }
        return EVMC_STORAGE_ASSIGNED;
    }();

    storage_[key] = value;

    return status;
}

STRATA_NAMESPACE_END
