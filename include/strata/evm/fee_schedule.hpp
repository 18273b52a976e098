#pragma once

#include <strata/core/assert.h>
#include <strata/core/int.hpp>
#include <strata/evm/config.hpp>
#include <strata/evm/revision.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>

STRATA_EVM_NAMESPACE_BEGIN

constexpr auto word_size = sizeof(uint256_t);
static_assert(word_size == 32);

constexpr size_t round_up_bytes_to_words(size_t const n) noexcept
{
    return (n + word_size - 1) / word_size;
}

// SSTORE transitions named by original -> current -> new value, where X, Y
// and Z are distinct non-zero words. Numbered as evmc_storage_status.
enum class StorageStatus
{
    Assigned = 0, // no cheaper case applies
    Added = 1, // 0 -> 0 -> Z
    Deleted = 2, // X -> X -> 0
    Modified = 3, // X -> X -> Z
    DeletedThenAdded = 4, // X -> 0 -> Z
    ModifiedThenDeleted = 5, // X -> Y -> 0
    DeletedThenRestored = 6, // X -> 0 -> X
    AddedThenDeleted = 7, // 0 -> Y -> 0
    ModifiedThenRestored = 8, // X -> Y -> X
};

// Appendix G

// G_zero
constexpr uint64_t zero_cost = 0;

// G_jumpdest
constexpr uint64_t jumpdest_cost = 1;

// G_base
constexpr uint64_t base_cost = 2;

// G_verylow
constexpr uint64_t very_low_cost = 3;

// G_low
constexpr uint64_t low_cost = 5;

// G_mid
constexpr uint64_t mid_cost = 8;

// G_high
constexpr uint64_t high_cost = 10;

// G_warmaccess, also the pre-Berlin cost of SLOAD
template <Revision rev>
constexpr uint64_t warm_access_cost()
{
    if constexpr (rev < Revision::TangerineWhistle) {
        return 50;
    }
    else if constexpr (rev < Revision::Istanbul) {
        return 200;
    }
    else if constexpr (rev == Revision::Istanbul) {
        return 800;
    }
    else {
        return 100;
    }
}

// G_coldaccountaccess
template <Revision rev>
constexpr uint64_t cold_account_access_cost()
{
    static_assert(rev >= Revision::Berlin);
    return 2600;
}

// G_coldsload
template <Revision rev>
constexpr uint64_t cold_sload_cost()
{
    static_assert(rev >= Revision::Berlin);
    return 2100;
}

// G_sset
constexpr uint64_t sset_cost = 20000;

// G_sreset
template <Revision rev>
constexpr uint64_t sreset_cost()
{
    if constexpr (rev < Revision::Berlin) {
        return 5000;
    }
    else {
        return 5000 - cold_sload_cost<rev>();
    }
}

// R_sclear
template <Revision rev>
constexpr uint64_t sclear_refund()
{
    if constexpr (rev < Revision::London) {
        return 15000;
    }
    else {
        return 4800;
    }
}

// R_selfdestruct
constexpr int64_t selfdestruct_refund = 24000;

// G_selfdestruct
template <Revision rev>
constexpr uint64_t selfdestruct_cost()
{
    if constexpr (rev < Revision::TangerineWhistle) {
        return 0;
    }
    else {
        return 5000;
    }
}

// G_create
constexpr uint64_t create_cost = 32000;

// G_codedeposit
constexpr uint64_t code_deposit_cost = 200;

// G_callvalue
constexpr uint64_t call_value_cost = 9000;

// G_callstipend
constexpr uint64_t call_stipend = 2300;

// G_newaccount
constexpr uint64_t new_account_cost = 25000;

// G_exp
constexpr uint64_t exp_cost = 10;

// G_expbyte
template <Revision rev>
constexpr uint64_t exp_byte_cost()
{
    if constexpr (rev < Revision::SpuriousDragon) {
        return 10;
    }
    else {
        return 50;
    }
}

// G_memory
constexpr uint64_t memory_cost = 3;

// G_log
constexpr uint64_t log_cost = 375;

// G_logdata
constexpr uint64_t log_data_cost = 8;

// G_logtopic
constexpr uint64_t log_topic_cost = 375;

// G_keccak256
constexpr uint64_t keccak256_cost = 30;

// G_keccak256word
constexpr uint64_t keccak256_cost_per_word = 6;

// G_copy
constexpr uint64_t copy_cost_per_word = 3;

// G_initcodeword, EIP-3860
constexpr uint64_t initcode_word_cost = 2;

// G_blockhash
constexpr uint64_t blockhash_cost = 20;

// EIP-170
constexpr size_t max_code_size = 24576;

// EIP-3860
constexpr size_t max_initcode_size = 2 * max_code_size;

// Costs of opcodes that read other accounts before EIP-2929 made them warm
// access costs

template <Revision rev>
constexpr uint64_t balance_cost()
{
    if constexpr (rev < Revision::TangerineWhistle) {
        return 20;
    }
    else if constexpr (rev < Revision::Istanbul) {
        return 400;
    }
    else if constexpr (rev < Revision::Berlin) {
        return 700;
    }
    else {
        return warm_access_cost<rev>();
    }
}

template <Revision rev>
constexpr uint64_t extcode_cost()
{
    if constexpr (rev < Revision::TangerineWhistle) {
        return 20;
    }
    else if constexpr (rev < Revision::Berlin) {
        return 700;
    }
    else {
        return warm_access_cost<rev>();
    }
}

template <Revision rev>
constexpr uint64_t extcodehash_cost()
{
    if constexpr (rev < Revision::Istanbul) {
        return 400;
    }
    else if constexpr (rev < Revision::Berlin) {
        return 700;
    }
    else {
        return warm_access_cost<rev>();
    }
}

template <Revision rev>
constexpr uint64_t call_cost()
{
    if constexpr (rev < Revision::TangerineWhistle) {
        return 40;
    }
    else if constexpr (rev < Revision::Berlin) {
        return 700;
    }
    else {
        return warm_access_cost<rev>();
    }
}

// Helpers

template <Revision rev>
constexpr auto additional_cold_account_access_cost =
    cold_account_access_cost<rev>() - warm_access_cost<rev>();

template <Revision rev>
constexpr auto additional_cold_sload_cost =
    cold_sload_cost<rev>() - warm_access_cost<rev>();

// EIP-1283 only applies to Constantinople, Petersburg reverted it and EIP-2200
// reintroduced it in Istanbul
template <Revision rev>
constexpr bool net_gas_metering =
    rev == Revision::Constantinople || rev >= Revision::Istanbul;

template <Revision rev>
constexpr uint64_t sstore_cost(StorageStatus const status)
{
    if constexpr (!net_gas_metering<rev>) {
        switch (status) {
        case StorageStatus::Added:
        case StorageStatus::DeletedThenAdded:
        case StorageStatus::DeletedThenRestored:
            return sset_cost;
        case StorageStatus::Deleted:
        case StorageStatus::Modified:
        case StorageStatus::Assigned:
        case StorageStatus::ModifiedThenDeleted:
        case StorageStatus::AddedThenDeleted:
        case StorageStatus::ModifiedThenRestored:
            return sreset_cost<rev>();
        }
    }
    else {
        switch (status) {
        case StorageStatus::Assigned:
        case StorageStatus::DeletedThenAdded:
        case StorageStatus::ModifiedThenDeleted:
        case StorageStatus::DeletedThenRestored:
        case StorageStatus::AddedThenDeleted:
        case StorageStatus::ModifiedThenRestored:
            return warm_access_cost<rev>();
        case StorageStatus::Added:
            return sset_cost;
        case StorageStatus::Deleted:
        case StorageStatus::Modified:
            return sreset_cost<rev>();
        }
    }
    STRATA_ABORT("unknown storage status");
}

template <Revision rev>
constexpr int64_t sstore_refund(StorageStatus const status)
{
    if constexpr (!net_gas_metering<rev>) {
        switch (status) {
        case StorageStatus::Deleted:
        case StorageStatus::ModifiedThenDeleted:
        case StorageStatus::AddedThenDeleted:
            return sclear_refund<rev>();
        case StorageStatus::Added:
        case StorageStatus::DeletedThenAdded:
        case StorageStatus::DeletedThenRestored:
        case StorageStatus::Modified:
        case StorageStatus::Assigned:
        case StorageStatus::ModifiedThenRestored:
            return 0;
        }
    }
    else {
        static_assert(
            sclear_refund<rev>() <= std::numeric_limits<int64_t>::max());
        static_assert(
            sreset_cost<rev>() <= std::numeric_limits<int64_t>::max());
        static_assert(
            warm_access_cost<rev>() <= std::numeric_limits<int64_t>::max());
        switch (status) {
        case StorageStatus::Assigned:
        case StorageStatus::Added:
        case StorageStatus::Modified:
            return 0;
        case StorageStatus::Deleted:
        case StorageStatus::ModifiedThenDeleted:
            return static_cast<int64_t>(sclear_refund<rev>());
        case StorageStatus::DeletedThenAdded:
            return -static_cast<int64_t>(sclear_refund<rev>());
        case StorageStatus::DeletedThenRestored:
            return static_cast<int64_t>(sreset_cost<rev>()) -
                   static_cast<int64_t>(warm_access_cost<rev>()) -
                   static_cast<int64_t>(sclear_refund<rev>());
        case StorageStatus::AddedThenDeleted:
            return static_cast<int64_t>(sset_cost - warm_access_cost<rev>());
        case StorageStatus::ModifiedThenRestored:
            return static_cast<int64_t>(
                sreset_cost<rev>() - warm_access_cost<rev>());
        }
    }
    STRATA_ABORT("unknown storage status");
}

constexpr uint64_t copy_cost(size_t const n)
{
    return round_up_bytes_to_words(n) * copy_cost_per_word;
}

// EIP-3529
template <Revision rev>
constexpr uint64_t max_refund_quotient()
{
    if constexpr (rev < Revision::London) {
        return 2;
    }
    else {
        return 5;
    }
}

STRATA_EVM_NAMESPACE_END
