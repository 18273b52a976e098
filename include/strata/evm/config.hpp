#pragma once

#include <strata/config.hpp>

#define STRATA_EVM_NAMESPACE_BEGIN                                             \
    STRATA_NAMESPACE_BEGIN namespace evm                                       \
    {

#define STRATA_EVM_NAMESPACE_END                                               \
    }                                                                          \
    STRATA_NAMESPACE_END
