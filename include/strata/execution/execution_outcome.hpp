#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/receipt.hpp>
#include <strata/evm/status.hpp>
#include <strata/state/state_diff.hpp>

#include <cstdint>
#include <optional>
#include <vector>

STRATA_NAMESPACE_BEGIN

// Result of one root call as reported to the host
struct ExecutionOutcome
{
    evm::Status status{evm::Status::Success};
    uint64_t gas_used{0};
    byte_string output{};
    std::vector<Log> logs{}; // only for successful outcomes
    StateDiff diff{};
    std::optional<Address> created{};
};

// RLP [status, gas_used, output, [[address, [topics], data]...], created]
// where created is an empty string unless a contract was deployed
byte_string encode_outcome(ExecutionOutcome const &);

STRATA_NAMESPACE_END
