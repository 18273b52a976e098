#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

STRATA_NAMESPACE_BEGIN

// Changes written to the host store by one root commit. Unset fields are
// unchanged.
struct AccountDiff
{
    Address address{};
    std::optional<uint64_t> nonce{};
    std::optional<uint256_t> balance{};
    std::optional<byte_string> code{};
    std::vector<std::pair<bytes32_t, bytes32_t>> storage{};
    bool destroyed{false};
};

struct StateDiff
{
    std::vector<AccountDiff> accounts{};
    size_t raw_keys_written{0};

    bool empty() const
    {
        return accounts.empty() && raw_keys_written == 0;
    }
};

STRATA_NAMESPACE_END
