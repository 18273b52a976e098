#pragma once

#include <strata/config.hpp>
#include <strata/core/address.hpp>
#include <strata/core/byte_string.hpp>
#include <strata/core/bytes.hpp>

#include <evmc/hex.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

struct StrataFmtDefaultParse
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx)
    {
        return ctx.begin();
    }
};

template <>
struct fmt::formatter<strata::Address> : public StrataFmtDefaultParse
{
    template <typename FormatContext>
    auto format(strata::Address const &a, FormatContext &ctx) const
    {
        return fmt::format_to(
            ctx.out(), "0x{}", evmc::hex({a.bytes, sizeof(a.bytes)}));
    }
};

template <>
struct fmt::formatter<strata::bytes32_t> : public StrataFmtDefaultParse
{
    template <typename FormatContext>
    auto format(strata::bytes32_t const &b, FormatContext &ctx) const
    {
        return fmt::format_to(
            ctx.out(), "0x{}", evmc::hex({b.bytes, sizeof(b.bytes)}));
    }
};
