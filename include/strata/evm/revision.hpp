#pragma once

#include <strata/evm/config.hpp>

#include <optional>
#include <string_view>

STRATA_EVM_NAMESPACE_BEGIN

// values match evmc_revision
enum Revision
{
    Frontier = 0,
    Homestead = 1,
    TangerineWhistle = 2,
    SpuriousDragon = 3,
    Byzantium = 4,
    Constantinople = 5,
    Petersburg = 6,
    Istanbul = 7,
    Berlin = 8,
    London = 9,
    Paris = 10,
    Shanghai = 11,
};

inline constexpr Revision latest_revision = Revision::Shanghai;

std::optional<Revision> revision_from_string(std::string_view);

char const *to_string(Revision);

STRATA_EVM_NAMESPACE_END
