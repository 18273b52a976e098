#pragma once

#include <strata/config.hpp>
#include <strata/core/bytes.hpp>
#include <strata/core/int.hpp>

#include <cstdint>
#include <optional>

STRATA_NAMESPACE_BEGIN

// Amount denominated in wei; never implicitly constructed from integers
class Wei
{
    uint256_t amount_{0};

public:
    static constexpr uint256_t eth_to_wei{1'000'000'000'000'000'000ull};

    constexpr Wei() = default;

    explicit constexpr Wei(uint256_t const &amount)
        : amount_{amount}
    {
    }

    static constexpr Wei zero()
    {
        return Wei{};
    }

    static constexpr Wei from_u64(uint64_t const amount)
    {
        return Wei{uint256_t{amount}};
    }

    static std::optional<Wei> from_eth(uint256_t const &);

    constexpr uint256_t const &raw() const
    {
        return amount_;
    }

    constexpr bool is_zero() const
    {
        return amount_ == 0;
    }

    bytes32_t to_bytes() const
    {
        return intx::be::store<bytes32_t>(amount_);
    }

    std::optional<Wei> checked_add(Wei const &) const;
    std::optional<Wei> checked_sub(Wei const &) const;

    // fails when the amount does not fit the bridged balance width
    std::optional<uint128_t> try_into_u128() const;

    friend constexpr bool operator==(Wei const &, Wei const &) = default;

    friend constexpr bool operator<(Wei const &a, Wei const &b)
    {
        return a.amount_ < b.amount_;
    }
};

STRATA_NAMESPACE_END
