#pragma once

#include <bit>
#include <climits>

#define STRATA_NAMESPACE_BEGIN                                                 \
    namespace strata                                                           \
    {

#define STRATA_NAMESPACE_END }

#define STRATA_NAMESPACE ::strata

#define STRATA_ANONYMOUS_NAMESPACE_BEGIN                                       \
    STRATA_NAMESPACE_BEGIN                                                     \
    namespace                                                                  \
    {

#define STRATA_ANONYMOUS_NAMESPACE_END                                         \
    }                                                                          \
    STRATA_NAMESPACE_END

static_assert(CHAR_BIT == 8);

static_assert(
    std::endian::native == std::endian::big ||
    std::endian::native == std::endian::little);
