#pragma once

#include <strata/config.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/result.hpp>

#include <cstdint>
#include <limits>
#include <optional>

STRATA_NAMESPACE_BEGIN

class State;

inline constexpr uint64_t no_pending_upgrade =
    std::numeric_limits<uint64_t>::max();

// Block index from which the staged code may be deployed
uint64_t get_upgrade_index(State &);

// Replaces any pending upgrade
void stage_upgrade(State &, byte_string_view code, uint64_t unlock_index);

// NoPendingUpgrade or NotReady without writing anything
Result<void> deploy_upgrade(State &, uint64_t block_index);

std::optional<byte_string> get_engine_code(State &);

STRATA_NAMESPACE_END
