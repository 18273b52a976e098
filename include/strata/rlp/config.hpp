#pragma once

#include <strata/config.hpp>

#define STRATA_RLP_NAMESPACE_BEGIN                                             \
    STRATA_NAMESPACE_BEGIN namespace rlp                                       \
    {

#define STRATA_RLP_NAMESPACE_END                                               \
    }                                                                          \
    STRATA_NAMESPACE_END
