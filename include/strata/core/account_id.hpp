#pragma once

#include <strata/config.hpp>

#include <cstddef>
#include <string_view>

STRATA_NAMESPACE_BEGIN

inline constexpr size_t min_account_id_length = 2;
inline constexpr size_t max_account_id_length = 64;

// Host account ids are 2 to 64 characters of [a-z0-9] separated by single
// '-', '_' or '.' characters
bool is_valid_account_id(std::string_view);

STRATA_NAMESPACE_END
