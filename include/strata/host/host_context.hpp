#pragma once

#include <strata/config.hpp>

#include <cstdint>
#include <string>

STRATA_NAMESPACE_BEGIN

// Per-invocation context supplied by the host runtime
struct HostContext
{
    uint64_t block_index{0};
    uint64_t block_timestamp{0};
    std::string predecessor_account_id{};
    std::string current_account_id{};
};

STRATA_NAMESPACE_END
